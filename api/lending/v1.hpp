#pragma once

#include "lending/v1/types.pb.h"

#include "lending/v1/admin_service.pb.h"
#include "lending/v1/catalog_service.pb.h"
#include "lending/v1/lending_service.pb.h"

#include "lending/v1/admin_service.grpc.pb.h"
#include "lending/v1/catalog_service.grpc.pb.h"
#include "lending/v1/lending_service.grpc.pb.h"
