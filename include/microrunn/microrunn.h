#pragma once

// Value type and the operations recorded on it, plus the backward pass
#include "microrunn/value.h"
// Neurons, layers and networks built from those operations
#include "microrunn/nn.h"
