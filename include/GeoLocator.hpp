#pragma once
#include <IpAddress.h>
#include <optional>
#include <string>

struct GeoLocation
{
    std::string country;
    std::string city;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string isp;
};

// Address to location lookup. Implementations own their caching.
class GeoLocator
{
public:
    virtual ~GeoLocator() = default;

    virtual std::optional<GeoLocation> lookup(const pcpp::IPAddress& ip) = 0;
};
