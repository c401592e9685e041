#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace tinynotes::server {

class AccountDirectory;
class DocumentStore;

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitRejected = 2;
inline constexpr int kExitUsage = 64;

struct AdminContext {
    DocumentStore& store;
    AccountDirectory& accounts;
};

// Runs one command (args[0]) and writes its JSON result to |out|. Document
// bodies for note-save and note-create are read from |in|.
int run_admin_command(const std::vector<std::string>& args,
                      AdminContext context,
                      std::istream& in,
                      std::ostream& out,
                      std::ostream& err);

void print_usage(std::ostream& err);

}  // namespace tinynotes::server
