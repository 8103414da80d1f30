#include "planner/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcScheduling, "planner.scheduling", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSync, "planner.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStorage, "planner.storage", QtInfoMsg)
Q_LOGGING_CATEGORY(lcService, "planner.service", QtInfoMsg)
