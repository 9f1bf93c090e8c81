#ifndef INCLUDE_ISOBOX_CLASSIFIER_H_
#define INCLUDE_ISOBOX_CLASSIFIER_H_

#include <string>

#include "limits.h"
#include "sandbox.h"
#include "execution.h"

// Everything the runner observed about one execution, before classification.
struct RawOutcome {
  bool setup_failed; // Configuring or launch failed; stats are not valid
  bool watchdog_killed; // the primitive did not stop the child in time
  bool cancelled; // killed on caller's request
  bool output_truncated;
  RunStats stats;
  std::string stdout_data, stderr_data;
  std::string message;

  RawOutcome() :
      setup_failed(false), watchdog_killed(false), cancelled(false),
      output_truncated(false) {}
};

// Pure; limits must be the ones enforced on the run. Decision order:
//   SE (setup/mechanism failure, forced kill) > TLE > MLE > OLE > SIG > RE > OK
Verdict ClassifyVerdict(const RawOutcome&, const LimitSpec&);

TerminationCause TerminationCauseOf(const RawOutcome&);

#endif  // INCLUDE_ISOBOX_CLASSIFIER_H_
