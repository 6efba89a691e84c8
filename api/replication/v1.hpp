#pragma once

#include "replication/v1/status.pb.h"
#include "replication/v1/target.pb.h"
