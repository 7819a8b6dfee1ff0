#include <oirun/verdict.hh>

namespace oirun {

std::optional<Verdict> verdict_from_str(std::string_view str) noexcept {
    for (auto verdict :
         {Verdict::AC,
          Verdict::COMPILE_ERROR,
          Verdict::TLE,
          Verdict::RE,
          Verdict::MLE,
          Verdict::SYSTEM_ERROR})
    {
        if (to_str(verdict) == str) {
            return verdict;
        }
    }
    return std::nullopt;
}

} // namespace oirun
