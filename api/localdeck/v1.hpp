#pragma once

#include "localdeck/deck/v1/types.pb.h"

#include "localdeck/deck/v1/deck_service.pb.h"

#include "localdeck/deck/v1/deck_service.grpc.pb.h"
