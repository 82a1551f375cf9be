#pragma once

#include "narrative/curation/v1/types.pb.h"
#include "narrative/curation/v1/curation_service.pb.h"

namespace narrative::curation::v1 {
}
