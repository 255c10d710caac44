#ifndef BINARYINSPECTOR_HPP
#define BINARYINSPECTOR_HPP

#include <cstddef>
#include <string_view>

/**
 * @brief Service for binary content detection
 *
 * Classifies the first bytes of a file. A sample is binary if it contains a
 * null byte, or if more than 30% of its bytes fall outside the text
 * allow-list: TAB, LF, FF, CR, ESC and everything from 0x20 to 0xFF.
 */
class BinaryContentInspector {
public:
  /** @brief Largest sample the caller should pass (8 KiB) */
  static constexpr std::size_t SAMPLE_SIZE = 8192;

  /**
   * @brief Check whether a byte is allowed in text
   */
  static bool isTextByte(unsigned char c) {
    switch (c) {
    case '\t':
    case '\n':
    case '\f':
    case '\r':
    case 0x1B:
      return true;
    default:
      return c >= 0x20;
    }
  }

  /**
   * @brief Classify a sample as binary or text
   * @param sample At most the first SAMPLE_SIZE bytes of a file
   * @return true if the sample looks binary; an empty sample is text
   */
  static bool sniff(std::string_view sample) {
    std::size_t non_text = 0;

    for (char ch : sample) {
      auto c = static_cast<unsigned char>(ch);
      if (c == 0)
        return true;
      if (!isTextByte(c))
        non_text++;
    }

    // non_text / size > 0.30, kept in integers
    return non_text * 10 > sample.size() * 3;
  }
};

#endif // BINARYINSPECTOR_HPP
