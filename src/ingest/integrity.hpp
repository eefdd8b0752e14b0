#pragma once
#include "completed_file.hpp"
#include "file_assembler.hpp"
#include "stats.hpp"

namespace goesrx {

// Turns a closed reassembly context into a CompletedFile with its status.
class IntegrityChecker {
public:
    explicit IntegrityChecker(Stats& stats) : stats_(stats) {}
    CompletedFile check(FileContext&& ctx);
private:
    bool check_dcs_trailer(const CompletedFile& f, std::string& note);
    Stats& stats_;
};

} // namespace goesrx
