#include "sentence_segmenter.h"
#include "utils.h"

namespace voxlink {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

/// Byte length of a terminator at pos (. ! ? or U+2026), 0 if none
size_t terminator_len(const std::string& s, size_t pos) {
    char c = s[pos];
    if (c == '.' || c == '!' || c == '?') return 1;
    if (s.compare(pos, 3, "\xE2\x80\xA6") == 0) return 3;  // …
    return 0;
}

/// Byte length of a closing quote/bracket at pos, 0 if none
size_t closer_len(const std::string& s, size_t pos) {
    char c = s[pos];
    if (c == '"' || c == '\'' || c == ')' || c == ']') return 1;
    if (s.compare(pos, 2, "\xC2\xBB") == 0) return 2;      // »
    if (s.compare(pos, 3, "\xE2\x80\x9D") == 0) return 3;  // ”
    if (s.compare(pos, 3, "\xE2\x80\x99") == 0) return 3;  // ’
    return 0;
}

} // namespace

SentenceSegmenter::SentenceSegmenter(size_t min_sentence_chars)
    : min_sentence_chars_(min_sentence_chars) {}

size_t SentenceSegmenter::boundary_end(size_t pos) const {
    size_t i = pos;
    size_t len;
    while (i < buffer_.size() && (len = terminator_len(buffer_, i)) > 0) i += len;
    if (i == pos) return std::string::npos;
    while (i < buffer_.size() && (len = closer_len(buffer_, i)) > 0) i += len;

    // Need at least one whitespace after the run; at buffer end we cannot tell yet
    if (i >= buffer_.size() || !is_space(buffer_[i])) return std::string::npos;
    while (i < buffer_.size() && is_space(buffer_[i])) i++;
    return i;
}

std::vector<std::string> SentenceSegmenter::feed(const std::string& fragment) {
    std::vector<std::string> sentences;
    buffer_ += fragment;

    size_t pos = scan_pos_;
    while (pos < buffer_.size()) {
        if (terminator_len(buffer_, pos) == 0) {
            pos++;
            continue;
        }
        size_t end = boundary_end(pos);
        if (end == std::string::npos) {
            // Skip this terminator run; if it reaches the buffer end, stop and retry on next feed
            size_t run = pos;
            size_t len;
            while (run < buffer_.size() && (len = terminator_len(buffer_, run)) > 0) run += len;
            while (run < buffer_.size() && (len = closer_len(buffer_, run)) > 0) run += len;
            if (run >= buffer_.size()) break;
            pos = run;
            continue;
        }

        std::string candidate = buffer_.substr(0, end);
        if (utils::count_word_chars(candidate) >= min_sentence_chars_) {
            sentences.push_back(std::move(candidate));
            buffer_.erase(0, end);
            pos = 0;
            scan_pos_ = 0;
        } else {
            // Too short to stand alone; keep it and look for the next boundary
            pos = end;
            scan_pos_ = end;
        }
    }
    return sentences;
}

std::string SentenceSegmenter::flush() {
    std::string rest;
    rest.swap(buffer_);
    scan_pos_ = 0;
    return rest;
}

void SentenceSegmenter::reset() {
    buffer_.clear();
    scan_pos_ = 0;
}

} // namespace voxlink
