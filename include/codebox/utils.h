#ifndef INCLUDE_CODEBOX_UTILS_H_
#define INCLUDE_CODEBOX_UTILS_H_

#include "errors.h"
#include "runtimes.h"
#include "execution.h"

long GetUniqueExecutionId();

const char* RuntimeName(Runtime);
const char* RuntimeImage(Runtime);
const char* LanguageFamilyName(LanguageFamily);

const char* OutcomeToAbr(Outcome);
const char* OutcomeToDesc(Outcome);
const char* OutcomeName(Outcome);

const char* ErrorCodeName(ErrorCode);
const char* ErrorCodeDesc(ErrorCode);
ErrorClass ErrorCodeClass(ErrorCode);
const char* ErrorClassName(ErrorClass);

#endif  // INCLUDE_CODEBOX_UTILS_H_
