#ifndef ROUTELOG_ROUTE_ROUTE_H
#define ROUTELOG_ROUTE_ROUTE_H

#include <string>
#include <string_view>

namespace routelog {

/**
 * A recorded session: a 16 character device id and a
 * "YYYY-MM-DD--HH-MM-SS" session name. Throws ParseError when either part
 * is malformed.
 */
class Route {
   public:
    static constexpr std::size_t DONGLE_ID_LENGTH = 16;
    static constexpr std::size_t NAME_LENGTH = 20;

    Route(std::string dongle_id, std::string name);

    const std::string &dongle_id() const { return dongle_id_; }
    const std::string &name() const { return name_; }

    /**
     * "dongle_id/name", the display and canonical form
     */
    std::string to_string() const;

    /**
     * "dongle_id|name", the form used in backend API paths
     */
    std::string api_name() const;

    static bool is_valid_dongle_id(std::string_view text);
    static bool is_valid_name(std::string_view text);

    bool operator==(const Route &other) const {
        return dongle_id_ == other.dongle_id_ && name_ == other.name_;
    }
    bool operator!=(const Route &other) const { return !(*this == other); }
    bool operator<(const Route &other) const {
        return dongle_id_ < other.dongle_id_ ||
               (dongle_id_ == other.dongle_id_ && name_ < other.name_);
    }

   private:
    std::string dongle_id_;
    std::string name_;
};

}  // namespace routelog

#endif  // ROUTELOG_ROUTE_ROUTE_H
