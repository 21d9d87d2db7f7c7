#ifndef STENCIL_LOG_ENCODING_ERROR_HPP
#define STENCIL_LOG_ENCODING_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace stencil {
    /// Raised when a record cannot be encoded as JSON (non-finite number,
    /// invalid UTF-8).  Carries the best-effort line that was produced
    /// instead, so the caller can still write something.
    class EncodingError : public std::runtime_error {
    public:
        explicit EncodingError(const std::string &what, std::string partial = std::string())
            : std::runtime_error(what), m_partial(std::move(partial)) {}

        const std::string &partialOutput() const { return m_partial; }

    private:
        std::string m_partial;
    };
} // namespace stencil

#endif // STENCIL_LOG_ENCODING_ERROR_HPP
