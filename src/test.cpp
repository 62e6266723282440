#include <rotator/rotator.hpp>
#include <rotator/args.hpp>
#include <rotator/handler.hpp>
#include <rotator/http_server.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

using namespace rotator;

static std::string markup(const std::string& url) {
    return HTML_PREFIX + url + HTML_SUFFIX;
}

static bool mentions(const std::optional<std::string>& html, const std::string& url) {
    return html && html->find(url) != std::string::npos;
}

void test_render_html() {
    std::cout << "Testing render_html..." << std::endl;

    assert(render_html("http://a/1.jpg") ==
           "<html><body><img src=\"http://a/1.jpg\"/></body></html>");
    // No escaping
    assert(render_html("x\"<y>") == "<html><body><img src=\"x\"<y>\"/></body></html>");

    std::cout << "  PASS" << std::endl;
}

void test_banner_show() {
    std::cout << "Testing Banner show/can_show..." << std::endl;

    Banner banner("http://a/1.jpg", 2);
    assert(banner.total() == 2);
    assert(banner.remaining() == 2);
    assert(banner.can_show());

    auto first = banner.show();
    assert(first && *first == markup("http://a/1.jpg"));
    assert(banner.remaining() == 1);

    assert(banner.show().has_value());
    assert(banner.remaining() == 0);
    assert(!banner.can_show());

    assert(!banner.show().has_value());
    assert(banner.remaining() == 0);
    assert(banner.total() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_banner_concurrent_depletion() {
    std::cout << "Testing Banner concurrent depletion..." << std::endl;

    const uint32_t total = 5000;
    Banner banner("http://c/1.jpg", total);
    std::atomic<uint32_t> wins{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 1000; ++i) {
                if (banner.try_consume()) wins++;
            }
        });
    }
    for (auto& t : threads) t.join();

    assert(wins.load() == total);
    assert(banner.remaining() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_weights_identity() {
    std::cout << "Testing CumulativeWeights identity..." << std::endl;

    Rng rng(1);
    auto weights = CumulativeWeights::identity();
    assert(weights.is_identity());
    assert(!weights.select(rng).has_value());
    assert(weights.total() == 0);

    weights.add_weight(3);
    for (int i = 0; i < 100; ++i) {
        assert(*weights.select(rng) == 0);
    }

    weights.add_weight(1);
    weights.add_weight(2);
    std::vector<uint64_t> expected = {3, 4, 6};
    assert(weights.prefix_sums() == expected);
    assert(weights.total() == 6);
    assert(weights.size() == 3);

    for (int i = 0; i < 1000; ++i) {
        auto pos = weights.select(rng);
        assert(pos && *pos < 3);
    }

    std::cout << "  PASS" << std::endl;
}

void test_weights_projection() {
    std::cout << "Testing CumulativeWeights projection..." << std::endl;

    Rng rng(2);
    auto weights = CumulativeWeights::projected();
    assert(!weights.is_identity());
    assert(!weights.select(rng).has_value());

    weights.add_weight_for(5, 7);
    for (int i = 0; i < 100; ++i) {
        assert(*weights.select(rng) == 7);
    }

    weights.add_weight_for(5, 11);
    weights.add_weight_for(5, 42);
    std::set<BannerPos> seen;
    for (int i = 0; i < 1000; ++i) {
        auto pos = weights.select(rng);
        assert(pos);
        assert(*pos == 7 || *pos == 11 || *pos == 42);
        seen.insert(*pos);
    }
    assert(seen.size() == 3);
    assert(weights.total() == 15);

    std::cout << "  PASS" << std::endl;
}

void test_weights_distribution() {
    std::cout << "Testing CumulativeWeights distribution..." << std::endl;

    Rng rng(42);
    auto weights = CumulativeWeights::identity();
    weights.add_weight(1000);
    weights.add_weight(3000);
    weights.add_weight(6000);

    const int trials = 100000;
    std::vector<int> hits(3, 0);
    for (int i = 0; i < trials; ++i) {
        hits[*weights.select(rng)]++;
    }

    double expected[] = {0.1, 0.3, 0.6};
    for (int i = 0; i < 3; ++i) {
        double freq = static_cast<double>(hits[i]) / trials;
        std::cout << "  pos " << i << ": " << freq << " (expected " << expected[i] << ")" << std::endl;
        assert(std::fabs(freq - expected[i]) < 0.01);
    }

    std::cout << "  PASS" << std::endl;
}

void test_category_index() {
    std::cout << "Testing CategoryIndex..." << std::endl;

    CategoryIndex index;
    index.add(0, std::vector<std::string>{"a", "b", "a"});
    index.add(1, std::vector<std::string>{"b"});
    index.add(2, std::vector<std::string>{"c", "a"});

    assert(index.category_count() == 3);
    assert(index.total_taggings() == 5);
    assert(index.contains("a"));
    assert(!index.contains("zzz"));

    std::vector<BannerPos> a = {0, 2};
    assert(index.positions("a") == a);
    assert(index.positions("zzz").empty());

    std::vector<std::string> cats0 = {"a", "b"};
    assert(index.categories_of(0) == cats0);
    assert(index.categories_of(99).empty());

    // Union, deduplicated, ascending, unknown keys ignored
    std::vector<BannerPos> all = {0, 1, 2};
    assert(index.candidates({"c", "b", "a", "b", "nope"}) == all);
    std::vector<BannerPos> b = {0, 1};
    assert(index.candidates({"b"}) == b);
    assert(index.candidates({"nope"}).empty());
    assert(index.candidates({}).empty());

    assert(index.position_bound() == 3);
    index.freeze();
    assert(index.frozen());
    assert(index.candidates({"a", "c"}) == a);
    assert(index.memory_usage() > 0);

    // Lookups on a frozen index never create categories
    assert(index.candidates({"new"}).empty());
    assert(!index.contains("new"));
    assert(index.category_count() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_inventory_validation() {
    std::cout << "Testing Inventory validation..." << std::endl;

    Inventory inv;
    assert(inv.insert("", 5, {"x"}) == ValidationError::IllegalUrl);
    assert(inv.insert("http://a", 0, {"x"}) == ValidationError::IllegalImpressionAmount);
    assert(inv.insert("http://a", -3, {"x"}) == ValidationError::IllegalImpressionAmount);
    assert(inv.insert("http://a", MAX_IMPRESSIONS + 1, {"x"}) ==
           ValidationError::IllegalImpressionAmount);
    assert(inv.insert("http://a", 5, {}) == ValidationError::EmptyCategories);
    // First failing check wins
    assert(inv.insert("", 0, {}) == ValidationError::IllegalUrl);
    assert(inv.size() == 0);
    assert(inv.index().category_count() == 0);
    assert(inv.global_weights().size() == 0);

    assert(inv.insert("http://a", 5, {"x"}) == ValidationError::None);
    assert(inv.insert("http://b", MAX_IMPRESSIONS, {"y"}) == ValidationError::None);
    assert(inv.size() == 2);
    assert(inv.global_weights().total() == 5 + static_cast<uint64_t>(MAX_IMPRESSIONS));

    assert(std::string(to_string(ValidationError::EmptyCategories)) == "empty categories");

    std::cout << "  PASS" << std::endl;
}

void test_inventory_budget() {
    std::cout << "Testing Inventory impression budget..." << std::endl;

    Inventory inv;
    assert(inv.insert("http://n/1.jpg", 7, {"n", "m"}) == ValidationError::None);
    inv.freeze();

    Rng rng(3);
    for (int i = 0; i < 7; ++i) {
        auto html = inv.select({"n"}, rng);
        assert(html && *html == markup("http://n/1.jpg"));
    }
    assert(!inv.select({"n"}, rng).has_value());
    assert(!inv.select({"m"}, rng).has_value());
    assert(!inv.select({}, rng).has_value());
    assert(inv.banner(0).remaining() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_example_two_categories() {
    std::cout << "Testing example: separate categories..." << std::endl;

    Inventory inv;
    assert(inv.insert("http://a/1.jpg", 2, {"x"}) == ValidationError::None);
    assert(inv.insert("http://b/1.jpg", 1, {"y"}) == ValidationError::None);
    inv.freeze();

    assert(mentions(inv.select({"x"}), "http://a/1.jpg"));
    assert(mentions(inv.select({"x"}), "http://a/1.jpg"));
    assert(!inv.select({"x"}).has_value());

    assert(mentions(inv.select({"y"}), "http://b/1.jpg"));
    assert(!inv.select({"y"}).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_example_shared_category() {
    std::cout << "Testing example: shared category..." << std::endl;

    Inventory inv;
    assert(inv.insert("http://p/1.jpg", 1, {"z"}) == ValidationError::None);
    assert(inv.insert("http://q/1.jpg", 1, {"z"}) == ValidationError::None);
    inv.freeze();

    auto first = inv.select({"z"});
    auto second = inv.select({"z"});
    assert(first && second);
    bool p_then_q = mentions(first, "http://p/1.jpg") && mentions(second, "http://q/1.jpg");
    bool q_then_p = mentions(first, "http://q/1.jpg") && mentions(second, "http://p/1.jpg");
    assert(p_then_q || q_then_p);
    assert(!inv.select({"z"}).has_value());

    std::cout << "  PASS" << std::endl;
}

void test_category_filter() {
    std::cout << "Testing Inventory category filter..." << std::endl;

    Inventory inv;
    assert(inv.insert("http://sport/1", 1000, {"sport"}) == ValidationError::None);
    assert(inv.insert("http://news/1", 1000, {"news"}) == ValidationError::None);
    assert(inv.insert("http://both/1", 1000, {"news", "sport"}) == ValidationError::None);
    assert(inv.insert("http://tiny/1", 1, {"sport"}) == ValidationError::None);
    inv.freeze();

    Rng rng(4);
    std::map<std::string, int> seen;
    for (int i = 0; i < 500; ++i) {
        auto html = inv.select({"sport"}, rng);
        assert(html);
        assert(!mentions(html, "http://news/1"));
        seen[*html]++;
    }
    assert(seen.count(markup("http://sport/1")));
    assert(seen.count(markup("http://both/1")));
    // Budget of one, never served twice
    assert(seen[markup("http://tiny/1")] <= 1);

    // Exhausted banners drop out of the eligible set
    std::vector<BannerPos> sport = inv.filter({"sport"});
    assert(inv.banner(3).remaining() == 0 ? sport.size() == 2 : sport.size() == 3);
    for (BannerPos pos : sport) {
        assert(inv.banner(pos).can_show());
    }

    assert(!inv.select({"weather"}, rng).has_value());
    assert(mentions(inv.select({"weather", "news"}, rng), "http://"));

    std::cout << "  PASS" << std::endl;
}

void test_filter_excludes_exhausted() {
    std::cout << "Testing Inventory filter after exhaustion..." << std::endl;

    Inventory inv;
    assert(inv.insert("http://one/1", 1, {"a", "b"}) == ValidationError::None);
    assert(inv.insert("http://two/1", 3, {"b"}) == ValidationError::None);
    inv.freeze();

    std::vector<BannerPos> both = {0, 1};
    assert(inv.filter({"b", "a", "b"}) == both);

    assert(mentions(inv.select({"a"}), "http://one/1"));
    std::vector<BannerPos> two = {1};
    assert(inv.filter({"a", "b"}) == two);
    assert(inv.filter({"a"}).empty());

    for (int i = 0; i < 3; ++i) {
        assert(mentions(inv.select({"a", "b"}), "http://two/1"));
    }
    assert(!inv.select({"a", "b"}).has_value());
    assert(inv.filter({"a", "b"}).empty());

    std::cout << "  PASS" << std::endl;
}

void test_global_distribution() {
    std::cout << "Testing Inventory global distribution..." << std::endl;

    Inventory inv;
    assert(inv.insert("http://w/1", 100000, {"a"}) == ValidationError::None);
    assert(inv.insert("http://w/2", 200000, {"b"}) == ValidationError::None);
    assert(inv.insert("http://w/3", 700000, {"c"}) == ValidationError::None);
    inv.freeze();

    Rng rng(5);
    const int trials = 50000;
    std::map<std::string, int> hits;
    for (int i = 0; i < trials; ++i) {
        auto html = inv.select({}, rng);
        assert(html);
        hits[*html]++;
    }

    double expected[] = {0.1, 0.2, 0.7};
    for (int i = 0; i < 3; ++i) {
        std::string url = "http://w/" + std::to_string(i + 1);
        double freq = static_cast<double>(hits[markup(url)]) / trials;
        std::cout << "  " << url << ": " << freq << std::endl;
        assert(std::fabs(freq - expected[i]) < 0.015);
    }

    std::cout << "  PASS" << std::endl;
}

void test_filtered_distribution_uses_total() {
    std::cout << "Testing filtered selection weights by total..." << std::endl;

    Inventory inv;
    assert(inv.insert("http://big/1", 90000, {"k"}) == ValidationError::None);
    assert(inv.insert("http://small/1", 10000, {"k"}) == ValidationError::None);
    inv.freeze();

    // Drain most of big's budget; its weight stays 90000
    Rng rng(6);
    for (int i = 0; i < 30000; ++i) {
        assert(inv.banner(0).try_consume());
    }

    const int trials = 20000;
    int big = 0;
    for (int i = 0; i < trials; ++i) {
        if (mentions(inv.select({"k"}, rng), "http://big/1")) big++;
    }
    double freq = static_cast<double>(big) / trials;
    assert(std::fabs(freq - 0.9) < 0.015);

    std::cout << "  PASS" << std::endl;
}

void test_seeded_reproducible() {
    std::cout << "Testing seeded selection is reproducible..." << std::endl;

    auto build = []() {
        auto inv = std::make_shared<Inventory>();
        for (int i = 0; i < 20; ++i) {
            std::string url = "http://r/" + std::to_string(i);
            assert(inv->insert(url, 50 + i, {i % 2 ? "odd" : "even", "all"}) == ValidationError::None);
        }
        inv->freeze();
        return inv;
    };

    auto a = build();
    auto b = build();
    Rng rng_a(99), rng_b(99);
    for (int i = 0; i < 300; ++i) {
        std::vector<std::string> cats;
        if (i % 3 == 1) cats = {"odd"};
        if (i % 3 == 2) cats = {"even", "all"};
        assert(a->select(cats, rng_a) == b->select(cats, rng_b));
    }

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_last_impression() {
    std::cout << "Testing concurrent race on last impression..." << std::endl;

    for (int round = 0; round < 50; ++round) {
        auto inv = std::make_shared<Inventory>();
        assert(inv->insert("http://last/1", 1, {"z"}) == ValidationError::None);
        inv->freeze();
        InventoryPtr shared = inv;

        std::atomic<bool> go{false};
        std::atomic<int> ready{0};
        std::atomic<int> wins{0};
        const int racers = 8;

        std::vector<std::thread> threads;
        for (int t = 0; t < racers; ++t) {
            threads.emplace_back([&]() {
                ready++;
                while (!go.load()) std::this_thread::yield();
                if (shared->select({"z"})) wins++;
            });
        }
        while (ready.load() < racers) std::this_thread::yield();
        go.store(true);
        for (auto& t : threads) t.join();

        assert(wins.load() == 1);
        assert(shared->banner(0).remaining() == 0);
    }

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_budget_never_exceeded() {
    std::cout << "Testing concurrent serving respects budgets..." << std::endl;

    auto inv = std::make_shared<Inventory>();
    assert(inv->insert("http://c/a", 100, {"x", "y"}) == ValidationError::None);
    assert(inv->insert("http://c/b", 50, {"y"}) == ValidationError::None);
    assert(inv->insert("http://c/c", 30, {"w"}) == ValidationError::None);
    inv->freeze();
    InventoryPtr shared = inv;

    std::atomic<int> a{0}, b{0}, c{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 1000; ++i) {
                std::vector<std::string> cats;
                if (t % 2 == 0) cats = {"y"};
                if (t == 3) cats = {};
                auto html = shared->select(cats);
                if (!html) continue;
                if (mentions(html, "http://c/a")) a++;
                else if (mentions(html, "http://c/b")) b++;
                else if (mentions(html, "http://c/c")) c++;
                else assert(false);
            }
        });
    }
    for (auto& t : threads) t.join();

    assert(a.load() <= 100);
    assert(b.load() <= 50);
    assert(c.load() <= 30);
    // Banners reachable through "y" are drained by the filtered callers
    assert(a.load() == 100);
    assert(b.load() == 50);
    assert(shared->banner(0).remaining() == 0);
    assert(shared->banner(1).remaining() == 0);
    assert(static_cast<uint32_t>(c.load()) + shared->banner(2).remaining() == 30);

    std::cout << "  PASS" << std::endl;
}

void test_split_fields() {
    std::cout << "Testing split_fields..." << std::endl;

    std::vector<std::string> plain = {"http://a", "3", "x", "y"};
    assert(split_fields("http://a;3;x;y") == plain);

    std::vector<std::string> quoted = {"a;b", "2", "x\"y", ""};
    assert(split_fields("\"a;b\";2;\"x\"\"y\";") == quoted);

    std::vector<std::string> single = {""};
    assert(split_fields("") == single);

    std::cout << "  PASS" << std::endl;
}

void test_config_loader() {
    std::cout << "Testing ConfigLoader..." << std::endl;

    std::istringstream in(
        "http://a/1.jpg;2;x\n"                  // 1 ok
        "\n"                                    // 2 blank
        ";5;x\n"                                // 3 empty url
        "http://b/1.jpg;0;x\n"                  // 4 zero amount
        "http://c/1.jpg;ten;x\n"                // 5 not a number
        "http://d/1.jpg;4\n"                    // 6 no categories
        "http://e/1.jpg;4;;\n"                  // 7 only empty categories
        "http://f/1.jpg;3;y;z\r\n"              // 8 ok, CRLF
        "\"http://g/1.jpg\";1;\"q;r\"\n"        // 9 ok, quoted
        "lonely\n"                              // 10 too few fields
        "http://h/1.jpg;-7;x\n");               // 11 negative

    Inventory inv;
    ConfigLoader loader(inv);
    LoadReport report = loader.load(in);

    assert(report.loaded == 3);
    assert(report.rejected == 5);
    assert(report.malformed == 2);
    assert(report.records() == 10);
    assert(report.errors.size() == 7);
    assert(report.errors[0].line == 3);
    assert(report.errors[0].message == "illegal url");
    assert(report.errors[1].line == 4);
    assert(report.errors[1].message == "illegal impression amount");
    assert(report.errors[2].line == 5);
    assert(report.errors[3].message == "empty categories");
    assert(report.errors[5].line == 10);

    assert(inv.size() == 3);
    assert(inv.banner(1).url() == "http://f/1.jpg");
    assert(inv.banner(2).url() == "http://g/1.jpg");
    assert(inv.index().contains("q;r"));
    std::vector<std::string> f_cats = {"y", "z"};
    assert(inv.index().categories_of(1) == f_cats);

    inv.freeze();
    assert(mentions(inv.select({"q;r"}), "http://g/1.jpg"));

    Inventory missing;
    LoadReport none;
    assert(!ConfigLoader(missing).load_file("/nonexistent/rotator/banners.csv", none));

    std::cout << "  PASS" << std::endl;
}

void test_query_decoding() {
    std::cout << "Testing query decoding..." << std::endl;

    assert(url_decode("%41b%2f+c") == "Ab/ c");
    assert(url_decode("100%") == "100%");
    assert(url_decode("%zz") == "%zz");

    BannerQuery q = parse_target("/?category=a&category%5B%5D=b+c&other=1&category=&category");
    assert(q.path == "/");
    std::vector<std::string> cats = {"a", "b c"};
    assert(q.categories == cats);

    BannerQuery bare = parse_target("/");
    assert(bare.path == "/" && bare.categories.empty());

    BannerQuery empty_q = parse_target("/?");
    assert(empty_q.path == "/" && empty_q.categories.empty());

    BannerQuery stats = parse_target("/stats?category=x#frag");
    assert(stats.path == "/stats");
    std::vector<std::string> x = {"x"};
    assert(stats.categories == x);

    BannerQuery arr = parse_target("/?category[]=sport&category[]=news");
    std::vector<std::string> sn = {"sport", "news"};
    assert(arr.categories == sn);

    std::cout << "  PASS" << std::endl;
}

void test_http_format() {
    std::cout << "Testing HTTP formatting and parsing..." << std::endl;

    std::string ok = format_response(HttpResponse::html("<b>"));
    assert(ok.compare(0, 17, "HTTP/1.1 200 OK\r\n") == 0);
    assert(ok.find("Content-Type: text/html; charset=utf-8\r\n") != std::string::npos);
    assert(ok.find("Content-Length: 3\r\n") != std::string::npos);
    assert(ok.find("Connection: close\r\n") != std::string::npos);
    assert(ok.size() >= 7 && ok.compare(ok.size() - 7, 7, "\r\n\r\n<b>") == 0);

    std::string nothing = format_response(HttpResponse::empty(204));
    assert(nothing.compare(0, 25, "HTTP/1.1 204 No Content\r\n") == 0);
    assert(nothing.find("Content-Length") == std::string::npos);
    assert(nothing.compare(nothing.size() - 4, 4, "\r\n\r\n") == 0);

    std::string bad_method = format_response(HttpResponse::empty(405));
    assert(bad_method.find("Allow: GET\r\n") != std::string::npos);

    HttpRequest req;
    assert(parse_request_line("GET /?category=a HTTP/1.1\r\nHost: x", req));
    assert(req.method == "GET");
    assert(req.target == "/?category=a");
    assert(req.version == "HTTP/1.1");

    HttpRequest bad;
    assert(!parse_request_line("GARBAGE", bad));
    assert(!parse_request_line("GET  HTTP/1.1", bad));
    assert(!parse_request_line("GET / FTP/1.0", bad));
    assert(!parse_request_line("GET http://x/ HTTP/1.1", bad));

    std::cout << "  PASS" << std::endl;
}

void test_handler() {
    std::cout << "Testing Handler routing..." << std::endl;

    auto inv = std::make_shared<Inventory>();
    assert(inv->insert("http://h/1.jpg", 1, {"x"}) == ValidationError::None);
    inv->freeze();
    Handler handler(inv, Rng(7));

    HttpRequest req;
    req.method = "GET";
    req.target = "/?category=x";
    HttpResponse first = handler.handle(req);
    assert(first.status == 200);
    assert(first.body == markup("http://h/1.jpg"));

    HttpResponse second = handler.handle(req);
    assert(second.status == 204);
    assert(handler.served() == 1);
    assert(handler.empty() == 1);

    req.target = "/stats";
    HttpResponse stats = handler.handle(req);
    assert(stats.status == 200);
    assert(stats.content_type == "application/json");
    json doc = json::parse(stats.body);
    assert(doc["banners"] == 1);
    assert(doc["exhausted"] == 1);
    assert(doc["impressions"]["served"] == 1);
    assert(doc["version"] == ROTATOR_VERSION);

    req.target = "/missing";
    assert(handler.handle(req).status == 404);

    req.method = "POST";
    req.target = "/";
    assert(handler.handle(req).status == 405);

    std::cout << "  PASS" << std::endl;
}

void test_stats_json() {
    std::cout << "Testing stats JSON..." << std::endl;

    Inventory inv;
    assert(inv.insert("http://s/1", 10, {"a", "b"}) == ValidationError::None);
    assert(inv.insert("http://s/2", 5, {"b"}) == ValidationError::None);
    inv.freeze();
    assert(inv.select({"a"}).has_value());

    json doc = stats_json(inv);
    assert(doc["banners"] == 2);
    assert(doc["categories"] == 2);
    assert(doc["taggings"] == 3);
    assert(doc["impressions"]["total"] == 15);
    assert(doc["impressions"]["remaining"] == 14);
    assert(doc["exhausted"] == 0);

    json b = banner_json(inv, 0);
    assert(b["url"] == "http://s/1");
    assert(b["remaining"] == 9);
    assert(b["categories"].size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_http_server_roundtrip() {
    std::cout << "Testing HttpServer roundtrip..." << std::endl;

    auto inv = std::make_shared<Inventory>();
    assert(inv->insert("http://net/1.jpg", 3, {"net"}) == ValidationError::None);
    inv->freeze();
    Handler handler(inv, Rng(8));

    HttpServer server("127.0.0.1", 0);
    assert(server.start());
    assert(server.port() != 0);
    assert(server.bind_address() == "127.0.0.1");
    assert(server.idle_timeout() == HttpServer::IDLE_TIMEOUT_MS);

    int client = socket(AF_INET, SOCK_STREAM, 0);
    assert(client >= 0);
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server.port());
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    assert(connect(client, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);

    std::string request = "GET /?category=net HTTP/1.1\r\nHost: localhost\r\n\r\n";
    assert(write(client, request.data(), request.size()) == static_cast<ssize_t>(request.size()));

    bool answered = false;
    for (int i = 0; i < 100 && !answered; ++i) {
        for (const auto& req : server.poll(50)) {
            assert(req.target == "/?category=net");
            server.respond(req.client_fd, handler.handle(req));
            answered = true;
        }
    }
    assert(answered);

    // Flush anything respond() could not write immediately
    for (int i = 0; i < 20 && server.connection_count() > 0; ++i) {
        server.poll(10);
    }

    std::string response;
    char buf[1024];
    ssize_t n;
    while ((n = read(client, buf, sizeof(buf))) > 0) {
        response.append(buf, static_cast<size_t>(n));
    }
    close(client);

    assert(response.compare(0, 17, "HTTP/1.1 200 OK\r\n") == 0);
    assert(response.find(markup("http://net/1.jpg")) != std::string::npos);
    assert(inv->banner(0).remaining() == 2);
    assert(server.pending_writes() == 0);

    server.stop();
    assert(!server.running());

    std::cout << "  PASS" << std::endl;
}

void test_http_server_idle_timeout() {
    std::cout << "Testing HttpServer idle timeout..." << std::endl;

    HttpServer server("127.0.0.1", 0);
    server.set_idle_timeout(50);
    assert(server.start());

    int client = socket(AF_INET, SOCK_STREAM, 0);
    assert(client >= 0);
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server.port());
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    assert(connect(client, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);

    // Connect but never send a request
    for (int i = 0; i < 100 && server.connection_count() == 0; ++i) {
        server.poll(10);
    }
    assert(server.connection_count() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    server.poll(0);
    assert(server.connection_count() == 0);

    // Server side closed the socket
    char buf[16];
    assert(read(client, buf, sizeof(buf)) == 0);
    close(client);

    server.stop();
    std::cout << "  PASS" << std::endl;
}

void test_parse_unsigned() {
    std::cout << "Testing parse_unsigned..." << std::endl;

    unsigned long long v = 7;
    assert(!parse_unsigned("abc", 100, v));
    assert(!parse_unsigned("-1", 100, v));
    assert(!parse_unsigned("+5", 100, v));
    assert(!parse_unsigned("", 100, v));
    assert(!parse_unsigned("12x", 100, v));
    assert(!parse_unsigned("101", 100, v));
    assert(!parse_unsigned("99999999999999999999999", UINT64_MAX, v));
    assert(v == 7);

    assert(parse_unsigned("42", 100, v));
    assert(v == 42);
    assert(parse_unsigned("18446744073709551615", UINT64_MAX, v));
    assert(v == UINT64_MAX);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Rotator Tests ===" << std::endl;
    std::cout << "version = " << ROTATOR_VERSION << std::endl;
    std::cout << std::endl;

    test_render_html();
    test_banner_show();
    test_banner_concurrent_depletion();
    test_weights_identity();
    test_weights_projection();
    test_weights_distribution();
    test_category_index();

    std::cout << std::endl;
    std::cout << "=== Inventory Tests ===" << std::endl;
    test_inventory_validation();
    test_inventory_budget();
    test_example_two_categories();
    test_example_shared_category();
    test_category_filter();
    test_filter_excludes_exhausted();
    test_global_distribution();
    test_filtered_distribution_uses_total();
    test_seeded_reproducible();
    test_concurrent_last_impression();
    test_concurrent_budget_never_exceeded();

    std::cout << std::endl;
    std::cout << "=== I/O Tests ===" << std::endl;
    test_split_fields();
    test_config_loader();
    test_query_decoding();
    test_http_format();
    test_handler();
    test_stats_json();
    test_http_server_roundtrip();
    test_http_server_idle_timeout();
    test_parse_unsigned();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
