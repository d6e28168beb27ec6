#ifndef CARDFORGE_ERRORS_HPP
#define CARDFORGE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace cardforge
{
    /**
     * The input can't be used as given (an empty BIN, a malformed digit string, a bad
     * quantity). The user can fix it.
     */
    struct input_error : public std::invalid_argument
    {
        using std::invalid_argument::invalid_argument;
    };

    /**
     * The BIN is too long, either for the brand it resolved to or for a BIN in general.
     * Carries the offending length and the limit it broke.
     */
    class length_error : public std::length_error
    {
        std::size_t p_length;
        std::size_t p_limit;
    public:
        length_error(const std::string& what, std::size_t length, std::size_t limit)
            : std::length_error(what), p_length(length), p_limit(limit)
        {}

        [[nodiscard]] inline std::size_t length() const noexcept { return p_length; }
        [[nodiscard]] inline std::size_t limit() const noexcept { return p_limit; }
    };

    /**
     * A freshly computed check digit didn't validate. The checksum arithmetic makes this
     * impossible, so seeing it means a bug rather than bad input.
     */
    struct checksum_consistency_fault : public std::logic_error
    {
        using std::logic_error::logic_error;
    };

    /**
     * The BIN registry couldn't be read or isn't shaped like one.
     */
    struct registry_error : public std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };
}

#endif //CARDFORGE_ERRORS_HPP
