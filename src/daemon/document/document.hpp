#pragma once

#include "errors.hpp"

#include <cstddef>
#include <deque>
#include <expected>
#include <string>
#include <vector>

// Editable UTF-8 text with an invertible edit log. Offsets and counts are in
// code points and are clamped to the document. Not thread-safe: only the
// interactive thread touches it.
class Document {
public:
    explicit Document(size_t max_undo = 1000);

    // InvalidParameterError if text is not valid UTF-8. Returns the number of
    // code points inserted.
    std::expected<size_t, Error> insert_at(size_t offset, const std::string& text);

    // Returns the number of code points removed.
    size_t erase(size_t offset, size_t count);

    bool undo();
    bool redo();
    bool can_undo() const { return !undo_.empty(); }
    bool can_redo() const { return !redo_.empty(); }
    void clear_history();

    std::string text() const;
    std::string slice(size_t offset, size_t count) const;
    size_t length() const { return text_.size(); }

    size_t caret() const { return caret_; }
    void set_caret(size_t offset);

    // Replaces content and clears history; the result is unmodified.
    std::expected<void, Error> load(const std::string& path);
    std::expected<void, Error> set_text(const std::string& text);

    // Inserts a file's content at the caret as one undoable edit.
    std::expected<size_t, Error> insert_file(const std::string& path);

    std::expected<void, Error> save(const std::string& path);

    bool modified() const { return modified_; }
    const std::string& path() const { return path_; }
    size_t max_undo() const { return max_undo_; }

private:
    struct Edit {
        enum class Kind { Insert, Erase };
        Kind kind;
        size_t offset;
        std::u32string text;
    };

    void apply(const Edit& edit);
    void revert(const Edit& edit);
    void record(Edit edit);

    std::u32string text_;
    size_t caret_ = 0;
    std::deque<Edit> undo_;
    std::vector<Edit> redo_;
    size_t max_undo_;
    bool modified_ = false;
    std::string path_;
};
