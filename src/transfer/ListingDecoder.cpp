#include "transfer/ListingDecoder.hpp"
#include "transfer/errors.hpp"

#include <cctype>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace d8::transfer {

namespace {

constexpr std::string_view kItemsKey = "items";

bool isSpace(const char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

}

ListingDecoder::ListingDecoder(EntryCallback onEntry) : onEntry_(std::move(onEntry)) {}

void ListingDecoder::feed(const std::string_view chunk) {
    for (const char c : chunk) {
        switch (state_) {
            case State::SeekingItemsKey: seek(c); break;
            case State::InArray: inArray(c); break;
            case State::Done: return;
        }
    }
}

void ListingDecoder::finish() const {
    switch (state_) {
        case State::Done: return;
        case State::SeekingItemsKey:
            throw ProtocolError("directory listing: stream ended before the items array");
        case State::InArray:
            throw ProtocolError(fmt::format("directory listing: stream ended inside the items array after {} entries",
                                            emitted_));
    }
}

void ListingDecoder::seek(const char c) {
    if (inString_) {
        if (escape_) escape_ = false;
        else if (c == '\\') escape_ = true;
        else if (c == '"') {
            inString_ = false;
            if (depth_ == 1) lastKey_ = std::move(keyBuf_);
            keyBuf_.clear();
            return;
        }
        // one byte past "items" is enough to rule a key out
        if (depth_ == 1 && keyBuf_.size() <= kItemsKey.size()) keyBuf_ += c;
        return;
    }

    if (isSpace(c)) return;

    if (awaitingItemsValue_) {
        if (c != '[') throw ProtocolError("directory listing: items is not a list");
        state_ = State::InArray;
        return;
    }

    if (!started_) {
        if (c != '{') throw ProtocolError("directory listing: expected a JSON object");
        started_ = true;
        depth_ = 1;
        return;
    }

    switch (c) {
        case '"':
            inString_ = true;
            keyBuf_.clear();
            break;
        case ':':
            if (depth_ == 1 && lastKey_ == kItemsKey) awaitingItemsValue_ = true;
            break;
        case ',':
            lastKey_.clear();
            break;
        case '{':
        case '[':
            ++depth_;
            break;
        case '}':
        case ']':
            if (--depth_ == 0) throw ProtocolError("directory listing: no items array");
            break;
        default:
            break;
    }
}

void ListingDecoder::inArray(const char c) {
    if (itemDepth_ > 0) {
        itemBuf_ += c;
        if (inString_) {
            if (escape_) escape_ = false;
            else if (c == '\\') escape_ = true;
            else if (c == '"') inString_ = false;
            return;
        }
        if (c == '"') inString_ = true;
        else if (c == '{' || c == '[') ++itemDepth_;
        else if ((c == '}' || c == ']') && --itemDepth_ == 0) {
            emitItem();
            itemBuf_.clear();
            expectSeparator_ = true;
        }
        return;
    }

    if (isSpace(c)) return;

    if (c == ']') {
        if (afterComma_) throw ProtocolError("directory listing: trailing comma in items");
        state_ = State::Done;
        return;
    }

    if (expectSeparator_) {
        if (c != ',') throw ProtocolError(fmt::format("directory listing: unexpected '{}' after item {}", c, emitted_));
        expectSeparator_ = false;
        afterComma_ = true;
        return;
    }

    if (c != '{') throw ProtocolError(fmt::format("directory listing: item {} is not an object", emitted_));

    itemDepth_ = 1;
    inString_ = false;
    escape_ = false;
    afterComma_ = false;
    itemBuf_.assign(1, c);
}

void ListingDecoder::emitItem() {
    ListingEntry entry;
    std::string type;
    try {
        const auto j = nlohmann::json::parse(itemBuf_);
        entry.name = j.at("name").get<std::string>();
        type = j.at("type").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(fmt::format("directory listing: malformed item {}: {}", emitted_, e.what()));
    }

    if (type == "file") entry.type = EntryType::File;
    else if (type == "dir") entry.type = EntryType::Dir;
    else throw ProtocolError(fmt::format("directory listing: invalid type '{}' for '{}'", type, entry.name));

    if (entry.name.empty() || entry.name == "." || entry.name == ".." || entry.name.find('/') != std::string::npos)
        throw ProtocolError(fmt::format("directory listing: invalid entry name '{}'", entry.name));

    ++emitted_;
    onEntry_(std::move(entry));
}

}
