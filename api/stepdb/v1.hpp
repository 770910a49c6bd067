#pragma once

#include "stepdb/v1/step.pb.h"
