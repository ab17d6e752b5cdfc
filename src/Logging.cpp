#include "Logging.h"

Q_LOGGING_CATEGORY(lcDetect, "chapters.detect", QtInfoMsg)
Q_LOGGING_CATEGORY(lcMaterialize, "chapters.materialize", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEpub, "chapters.epub", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPdf, "chapters.pdf", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCli, "chapters.cli", QtInfoMsg)
