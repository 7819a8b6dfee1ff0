#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace oirun::backend {

// Removes shell metacharacters and control characters, then trims
std::string sanitize_argument(std::string_view arg);

// Wraps @p arg in single quotes, embedded quotes are escaped
std::string shell_quote(std::string_view arg);

/**
 * Builds the single shell command string handed to `bash -c` inside a
 * container. Only allow-listed tools and executables placed in temporary
 * directories may be run, every argument is sanitized and quoted.
 */
class CommandSanitizer {
    std::vector<std::string> safe_dirs_; // with trailing '/'

public:
    // /tmp, /var/tmp and $TMPDIR are always safe
    explicit CommandSanitizer(const std::vector<std::string>& extra_safe_dirs = {});

    [[nodiscard]] bool is_allowed_command(std::string_view command) const;

    /**
     * @brief Returns `<command> '<arg1>' '<arg2>'...`
     *
     * @errors Throws BackendError if @p command is not allowed
     */
    [[nodiscard]] std::string
    build(std::string_view command, const std::vector<std::string>& args) const;
};

} // namespace oirun::backend
