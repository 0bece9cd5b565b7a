#pragma once

#include "relay/v1/types.pb.h"
#include "relay/v1/relay_service.pb.h"
