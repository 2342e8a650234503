#pragma once

#include "blobgate/facade/encoders.hpp"
#include "blobgate/facade/route_table.hpp"
#include "blobgate/facade/wire.hpp"
#include "blobgate/storage/content_store.hpp"

#include <string>

namespace blobgate::facade {

struct FacadeOptions {
    bool enable_compression = true;
    size_t compression_min_bytes = 1024;
    std::string service_name = "blobgate";
};

/// Translates wire requests of every supported protocol family into content
/// store operations and encodes the results back.
///
/// Stateless apart from the store reference; handle() is safe to call from
/// many worker threads at once.
class ProtocolFacade {
public:
    ProtocolFacade(ContentStore& store, FacadeOptions options = {});

    WireResponse handle(const WireRequest& request) const;

    // Route a request without executing it (metrics, logging)
    Route route(const WireRequest& request) const;

private:
    WireResponse dispatch(const Route& route, const WireRequest& request) const;

    WireResponse list_buckets(const Route& route) const;
    WireResponse create_bucket(const Route& route, const WireRequest& request) const;
    WireResponse delete_bucket(const Route& route) const;
    WireResponse head_bucket(const Route& route) const;
    WireResponse get_bucket(const Route& route) const;
    WireResponse list_objects(const Route& route, const WireRequest& request) const;
    WireResponse get_object(const Route& route, const WireRequest& request) const;
    WireResponse head_object(const Route& route) const;
    WireResponse put_object(const Route& route, const WireRequest& request,
                            const std::string& key) const;
    WireResponse delete_object(const Route& route) const;
    WireResponse propfind(const Route& route, const WireRequest& request) const;
    WireResponse mkcol(const Route& route) const;
    WireResponse dav_options() const;
    WireResponse health() const;

    WireResponse error(const Route& route, ErrorCode code, bool bucket_scope,
                       const std::string& message) const;
    WireResponse error(const Route& route, int status, const std::string& name,
                       const std::string& message) const;

    ContentStore& store_;
    FacadeOptions options_;
};

// CORS headers carried by every response
void apply_cors_headers(net::HttpHeaders& headers);

}  // namespace blobgate::facade
