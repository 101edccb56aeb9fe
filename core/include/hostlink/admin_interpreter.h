#pragma once
#include "hostlink/host.h"

#include <mutex>
#include <string>
#include <vector>

namespace hostlink {

// Administrative command interpreter. Owners register literal/argument
// trees; execute() walks them token by token and runs the matched handler
// synchronously against the caller's reply sink.
class AdminInterpreter {
public:
    // A second root with the same literal and owner replaces the first.
    void register_root(CommandRoot root);
    void unregister_owner(const std::string& owner_id);

    std::vector<CommandRoot> roots() const;

    // Returns true when a handler ran. Otherwise replies
    // "Unknown command: ..." or "Incomplete command: ..." through `sink`.
    bool execute(const std::string& command, ReplySink& sink) const;

private:
    mutable std::mutex mu_;
    std::vector<CommandRoot> roots_;
};

} // namespace hostlink
