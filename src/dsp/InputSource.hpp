/**
 * @file InputSource.hpp
 * @brief Interface for pull model sample sources.
 */

#ifndef KEYTONE_INPUT_SOURCE_HPP
#define KEYTONE_INPUT_SOURCE_HPP

#include <span>

namespace keytone {

/**
 * @brief Interface for sources that can be pulled from (Pull Model).
 *
 * The audio sink decides when and how many samples it needs; sources only
 * fill the span they are handed.
 */
class InputSource {
public:
    virtual ~InputSource() = default;

    /**
     * @brief Pull data from this input source into output span.
     *
     * @param output Output buffer to fill (mono, block-based)
     */
    virtual void pull(std::span<float> output) = 0;
};

} // namespace keytone

#endif // KEYTONE_INPUT_SOURCE_HPP
