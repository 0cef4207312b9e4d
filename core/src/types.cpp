#include "warden/types.h"

namespace warden {

const char* verdict_name(Verdict v) {
    switch (v) {
        case Verdict::LEGITIMATE:       return "legitimate";
        case Verdict::MISSING_METADATA: return "missing_metadata";
        case Verdict::ADVERSARIAL:      return "adversarial";
    }
    return "adversarial";
}

} // namespace warden
