#include "Logging.h"

// debug 默认关闭，info 以上默认打开
Q_LOGGING_CATEGORY(lcApp, "sccdepth.app", QtInfoMsg)
Q_LOGGING_CATEGORY(lcInput, "sccdepth.input", QtInfoMsg)
Q_LOGGING_CATEGORY(lcScc, "sccdepth.scc", QtInfoMsg)
