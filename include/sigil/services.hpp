#ifndef SIGIL_SERVICES_HPP
#define SIGIL_SERVICES_HPP

#include "sigil/util/assert.hpp"
#include "sigil/util/severity.hpp"

#include "sigil/diagnostic.hpp"
#include "sigil/fwd.hpp"

namespace sigil {

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    constexpr virtual ~Logger() = default;

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        SIGIL_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Forwards `diagnostic` to `operator()` if its severity is high enough.
    void log(const Diagnostic& diagnostic)
    {
        if (can_log(diagnostic.severity)) {
            (*this)(diagnostic);
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace sigil

#endif
