#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(rtCore, "readtune.core")
Q_LOGGING_CATEGORY(rtState, "readtune.state")
Q_LOGGING_CATEGORY(rtEnv, "readtune.environment")
Q_LOGGING_CATEGORY(rtAgent, "readtune.agent")
Q_LOGGING_CATEGORY(rtTraining, "readtune.training")
Q_LOGGING_CATEGORY(rtStore, "readtune.store")
