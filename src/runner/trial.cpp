#include "vconf/trial.hpp"

#include <spdlog/spdlog.h>

namespace vconf {

TrialSummary run_trials(const std::vector<Trial>& trials, std::ostream& out) {
    TrialSummary summary;
    std::vector<std::pair<std::string, std::string>> details;

    out << "\nrunning " << trials.size() << (trials.size() == 1 ? " test" : " tests") << "\n";

    for (const auto& trial : trials) {
        spdlog::info("running trial {}", trial.name);
        auto result = trial.body ? trial.body()
                                 : Result<void>::err(Error(ErrorCode::HOST_UNAVAILABLE, "trial has no body"));
        if (result.isOk()) {
            ++summary.passed;
            out << "test " << trial.name << " ... ok\n";
        } else {
            ++summary.failed;
            summary.failures.push_back(trial.name);
            details.emplace_back(trial.name, result.error().message());
            out << "test " << trial.name << " ... FAILED\n";
        }
    }

    if (!details.empty()) {
        out << "\nfailures:\n";
        for (const auto& [name, message] : details) {
            out << "\n---- " << name << " ----\n" << message << "\n";
        }
        out << "\nfailures:\n";
        for (const auto& name : summary.failures) {
            out << "    " << name << "\n";
        }
    }

    out << "\ntest result: " << (summary.ok() ? "ok" : "FAILED") << ". " << summary.passed
        << " passed; " << summary.failed << " failed\n";
    out.flush();
    return summary;
}

} // namespace vconf
