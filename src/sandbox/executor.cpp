#include "sandbox/executor.hpp"
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace codegrade::sandbox {
using namespace std;

backend parse_backend(const string &text) {
    string name = to_lower(text);
    if (name == "auto") return backend::AUTO;
    if (name == "local") return backend::LOCAL;
    if (name == "remote") return backend::REMOTE;
    throw invalid_argument("Unknown backend " + text + ", expected auto, local or remote");
}

executor_factory::executor_factory(shared_ptr<executor> local, shared_ptr<executor> remote)
    : local(move(local)), remote(move(remote)) {}

executor &executor_factory::select(const language &lang, backend preference) const {
    if (preference != backend::REMOTE && local && local->supports(lang))
        return *local;
    if (preference != backend::LOCAL && remote && remote->supports(lang))
        return *remote;

    switch (preference) {
        case backend::LOCAL:
            throw language_unsupported(lang.id, "no local interpreter available");
        case backend::REMOTE:
            throw language_unsupported(lang.id, "remote sandbox disabled or language unknown to it");
        default:
            throw language_unsupported(lang.id, "no executor available");
    }
}

}  // namespace codegrade::sandbox
