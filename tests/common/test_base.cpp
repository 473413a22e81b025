#include "test_base.h"

Q_LOGGING_CATEGORY(montageTests, "montage.tests")
