#pragma once

#include "taskengine/v1/task.pb.h"
#include "taskengine/v1/task_service.pb.h"
#include "taskengine/v1/task_service.grpc.pb.h"
