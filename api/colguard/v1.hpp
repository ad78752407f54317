#pragma once

#include "colguard/v1/artifact.pb.h"
