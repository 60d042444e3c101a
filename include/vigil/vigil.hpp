#pragma once

#include "vigil/activations.hpp"
#include "vigil/architecture.hpp"
#include "vigil/backprop.hpp"
#include "vigil/checkpoint.hpp"
#include "vigil/config.hpp"
#include "vigil/core.hpp"
#include "vigil/engine_config.hpp"
#include "vigil/errors.hpp"
#include "vigil/experience_buffer.hpp"
#include "vigil/experience_io.hpp"
#include "vigil/exploration.hpp"
#include "vigil/gradient_clipper.hpp"
#include "vigil/initializer.hpp"
#include "vigil/logging.hpp"
#include "vigil/lr_scheduler.hpp"
#include "vigil/optimizer.hpp"
#include "vigil/serialization.hpp"
#include "vigil/training_engine.hpp"
#include "vigil/watchdog.hpp"
