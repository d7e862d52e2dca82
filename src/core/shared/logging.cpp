#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(rpCore, "reelpick.core")
Q_LOGGING_CATEGORY(rpStore, "reelpick.store")
Q_LOGGING_CATEGORY(rpTaste, "reelpick.taste")
Q_LOGGING_CATEGORY(rpRetrieval, "reelpick.retrieval")
Q_LOGGING_CATEGORY(rpRanking, "reelpick.ranking")
Q_LOGGING_CATEGORY(rpRun, "reelpick.run")
