#ifndef INCLUDE_ISOBOX_UTILS_H_
#define INCLUDE_ISOBOX_UTILS_H_

#include <string>

#include "config.h"
#include "box_pool.h"
#include "execution.h"

const char* VerdictToDesc(Verdict);
const char* VerdictToAbr(Verdict);
// returns false if str is not a known abbreviation
bool AbrToVerdict(const std::string& str, Verdict* verdict);

const char* SandboxTypeName(SandboxType);
bool GetSandboxType(const std::string&, SandboxType*);

// logging
const char* ExecuteStatusName(ExecuteStatus);
const char* TerminationCauseName(TerminationCause);
const char* SlotStateName(SlotState);

#endif  // INCLUDE_ISOBOX_UTILS_H_
