#include <rotator/handler.hpp>
#include <rotator/log.hpp>
#include <rotator/query.hpp>
#include <rotator/stats.hpp>

namespace rotator {

HttpResponse Handler::handle(const HttpRequest& request) {
    // GET only: a banner request consumes an impression
    if (request.method != "GET") {
        return HttpResponse::empty(405);
    }

    BannerQuery query = parse_target(request.target);
    HttpResponse response;

    if (query.path == "/") {
        auto markup = inventory_->select(query.categories, rng_);
        if (markup) {
            served_++;
            response = HttpResponse::html(std::move(*markup));
        } else {
            empty_++;
            response = HttpResponse::empty(204);
        }
        log_debug("handler", "fd=%d categories=%zu -> %d", request.client_fd,
                  query.categories.size(), response.status);
    } else if (query.path == "/stats") {
        response = HttpResponse::json(stats_string(*inventory_));
    } else {
        response = HttpResponse::empty(404);
    }

    return response;
}

} // namespace rotator
