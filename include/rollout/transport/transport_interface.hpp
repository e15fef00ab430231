#ifndef ROLLOUT_TRANSPORT_INTERFACE_HPP
#define ROLLOUT_TRANSPORT_INTERFACE_HPP

#include <string>

namespace rollout {

    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string& formattedEntry) = 0;
    };

} // namespace rollout

#endif // ROLLOUT_TRANSPORT_INTERFACE_HPP
