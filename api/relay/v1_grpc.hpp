#pragma once

#include "relay/v1.hpp"
#include "relay/v1/relay_service.grpc.pb.h"
