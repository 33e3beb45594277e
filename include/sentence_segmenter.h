#pragma once

#include <string>
#include <vector>

namespace voxlink {

/**
 * @brief Splits an incrementally arriving text stream into sentences.
 *
 * A sentence ends at a run of terminators (. ! ? …), optionally followed by
 * closing quotes or brackets, that is itself followed by whitespace. The
 * whitespace belongs to the emitted sentence. Candidates with fewer than
 * min_sentence_chars letters/digits stay buffered and merge with the text
 * that follows.
 *
 * Lossless: concatenating every emitted sentence and the final flush()
 * reproduces the concatenation of all fed fragments.
 */
class SentenceSegmenter {
public:
    explicit SentenceSegmenter(size_t min_sentence_chars = 3);

    /**
     * @brief Append a fragment
     * @return Sentences completed by this fragment, in order
     */
    std::vector<std::string> feed(const std::string& fragment);

    /**
     * @brief Return and clear whatever is still buffered
     */
    std::string flush();

    const std::string& remainder() const { return buffer_; }

    void reset();

private:
    /// End of the sentence boundary starting at pos, or npos if none (yet)
    size_t boundary_end(size_t pos) const;

    std::string buffer_;
    size_t min_sentence_chars_;
    size_t scan_pos_ = 0;  ///< Everything before this has been rejected as a boundary
};

} // namespace voxlink
