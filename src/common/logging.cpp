#include "common/logging.h"
Q_LOGGING_CATEGORY(lcFormat, "dsc.format")
Q_LOGGING_CATEGORY(lcDecoder, "dsc.decoder")
Q_LOGGING_CATEGORY(lcPipeline, "dsc.pipeline")
Q_LOGGING_CATEGORY(lcTransport, "dsc.transport")
