#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace d8::http {

struct CaseInsensitiveLess {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const;
};

class Headers {
public:
    Headers() = default;
    Headers(std::initializer_list<std::pair<const std::string, std::string>> init) : map_(init) {}

    void set(const std::string& name, std::string value) { map_[name] = std::move(value); }
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
    [[nodiscard]] bool has(std::string_view name) const { return map_.contains(name); }
    void clear() { map_.clear(); }

    // Parses one "Name: value" line as delivered by a header callback.
    void addRaw(std::string_view line);

    [[nodiscard]] auto begin() const { return map_.begin(); }
    [[nodiscard]] auto end() const { return map_.end(); }
    [[nodiscard]] std::size_t size() const { return map_.size(); }

private:
    std::map<std::string, std::string, CaseInsensitiveLess> map_;
};

}
