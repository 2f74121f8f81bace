#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(afCore, "attemptflow.core")
Q_LOGGING_CATEGORY(afStore, "attemptflow.store")
Q_LOGGING_CATEGORY(afIngest, "attemptflow.ingest")
Q_LOGGING_CATEGORY(afStream, "attemptflow.stream")
Q_LOGGING_CATEGORY(afLearning, "attemptflow.learning")
Q_LOGGING_CATEGORY(afJudge, "attemptflow.judge")
Q_LOGGING_CATEGORY(afIpc, "attemptflow.ipc")
