#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace d8::transfer {

enum class EntryType { File, Dir };

struct ListingEntry {
    std::string name;
    EntryType type = EntryType::File;
};

// Incremental decoder for {"items":[{"name":...,"type":"file"|"dir"}, ...]}.
// Bytes may be fed in chunks split at any position; only the item currently
// being read is buffered.
class ListingDecoder {
public:
    enum class State { SeekingItemsKey, InArray, Done };

    using EntryCallback = std::function<void(ListingEntry&&)>;

    explicit ListingDecoder(EntryCallback onEntry);

    void feed(std::string_view chunk);

    // Throws ProtocolError unless the items array was closed.
    void finish() const;

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] std::size_t entriesEmitted() const { return emitted_; }

private:
    void seek(char c);
    void inArray(char c);
    void emitItem();

    EntryCallback onEntry_;
    State state_ = State::SeekingItemsKey;
    std::size_t emitted_ = 0;

    // SeekingItemsKey
    bool started_ = false;
    int depth_ = 0;
    bool inString_ = false;
    bool escape_ = false;
    bool awaitingItemsValue_ = false;
    std::string keyBuf_;
    std::string lastKey_;

    // InArray
    int itemDepth_ = 0;
    bool expectSeparator_ = false;
    bool afterComma_ = false;
    std::string itemBuf_;
};

}
