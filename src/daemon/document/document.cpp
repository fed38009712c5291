#include "document/document.hpp"
#include "document/utf8.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace {

std::expected<std::string, Error> read_text_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return std::unexpected(Error{ErrorCode::Io, std::format("cannot open {}: {}", path, std::strerror(errno))});
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        return std::unexpected(Error{ErrorCode::Io, std::format("read failed: {}", path)});
    }
    return ss.str();
}

std::expected<std::u32string, Error> decode_text(const std::string& text, const std::string& what) {
    auto decoded = utf8::decode(text);
    if (!decoded) {
        return std::unexpected(Error{ErrorCode::InvalidParameter, std::format("{} is not valid UTF-8", what)});
    }
    return std::move(*decoded);
}

} // namespace

Document::Document(size_t max_undo)
    : max_undo_(max_undo) {}

std::expected<size_t, Error> Document::insert_at(size_t offset, const std::string& text) {
    auto decoded = decode_text(text, "text");
    if (!decoded) return std::unexpected(decoded.error());
    if (decoded->empty()) return 0;

    Edit edit{Edit::Kind::Insert, std::min(offset, text_.size()), std::move(*decoded)};
    size_t n = edit.text.size();
    apply(edit);
    record(std::move(edit));
    return n;
}

size_t Document::erase(size_t offset, size_t count) {
    offset = std::min(offset, text_.size());
    count = std::min(count, text_.size() - offset);
    if (count == 0) return 0;

    Edit edit{Edit::Kind::Erase, offset, text_.substr(offset, count)};
    apply(edit);
    record(std::move(edit));
    return count;
}

bool Document::undo() {
    if (undo_.empty()) return false;
    auto edit = std::move(undo_.back());
    undo_.pop_back();
    revert(edit);
    redo_.push_back(std::move(edit));
    modified_ = true;
    return true;
}

bool Document::redo() {
    if (redo_.empty()) return false;
    auto edit = std::move(redo_.back());
    redo_.pop_back();
    apply(edit);
    undo_.push_back(std::move(edit));
    modified_ = true;
    return true;
}

void Document::clear_history() {
    undo_.clear();
    redo_.clear();
}

std::string Document::text() const {
    return utf8::encode(text_);
}

std::string Document::slice(size_t offset, size_t count) const {
    offset = std::min(offset, text_.size());
    return utf8::encode(std::u32string_view(text_).substr(offset, count));
}

void Document::set_caret(size_t offset) {
    caret_ = std::min(offset, text_.size());
}

std::expected<void, Error> Document::load(const std::string& path) {
    auto content = read_text_file(path);
    if (!content) return std::unexpected(content.error());
    if (auto r = set_text(*content); !r) return r;
    path_ = path;
    return {};
}

std::expected<void, Error> Document::set_text(const std::string& text) {
    auto decoded = decode_text(text, "text");
    if (!decoded) return std::unexpected(decoded.error());
    text_ = std::move(*decoded);
    caret_ = 0;
    clear_history();
    modified_ = false;
    return {};
}

std::expected<size_t, Error> Document::insert_file(const std::string& path) {
    auto content = read_text_file(path);
    if (!content) return std::unexpected(content.error());
    if (!utf8::valid(*content)) {
        return std::unexpected(Error{ErrorCode::InvalidParameter, std::format("{} is not valid UTF-8", path)});
    }
    return insert_at(caret_, *content);
}

std::expected<void, Error> Document::save(const std::string& path) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        return std::unexpected(Error{ErrorCode::Io, std::format("cannot write {}: {}", path, std::strerror(errno))});
    }
    auto bytes = text();
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    f.flush();
    if (!f) {
        return std::unexpected(Error{ErrorCode::Io, std::format("write failed: {}", path)});
    }
    path_ = path;
    modified_ = false;
    return {};
}

void Document::apply(const Edit& edit) {
    const size_t n = edit.text.size();
    if (edit.kind == Edit::Kind::Insert) {
        text_.insert(edit.offset, edit.text);
        if (caret_ >= edit.offset) caret_ += n;
    } else {
        text_.erase(edit.offset, n);
        if (caret_ > edit.offset) caret_ -= std::min(n, caret_ - edit.offset);
    }
    modified_ = true;
}

void Document::revert(const Edit& edit) {
    apply(Edit{edit.kind == Edit::Kind::Insert ? Edit::Kind::Erase : Edit::Kind::Insert,
               edit.offset, edit.text});
}

void Document::record(Edit edit) {
    redo_.clear();
    undo_.push_back(std::move(edit));
    while (undo_.size() > max_undo_) undo_.pop_front();
}
