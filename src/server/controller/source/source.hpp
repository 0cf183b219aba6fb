/*
 * source.hpp - Source Extension Controller
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SHIORI_SERVER_CONTROLLER_SOURCE_HPP
#define SHIORI_SERVER_CONTROLLER_SOURCE_HPP

#include "../controller.hpp"
#include "../../utils/response.hpp"
#include "source_params.hpp"

#include <functional>
#include <string>
#include <type_traits>
#include <vector>

#include "atom/log/spdlog_logger.hpp"
#include "extension/source_service.hpp"

namespace shiori::server::controller {

using ResponseBuilder = utils::ResponseBuilder;

/**
 * @brief Controller for source extensions via HTTP API
 *
 * Provides REST endpoints under /api/source for:
 * - Listing installed and available sources
 * - Installing, updating and uninstalling sources
 * - Browsing a source catalog (popular, latest, search, manga, chapters,
 *   pages)
 */
class SourceController : public Controller {
public:
    SourceController(extension::SourceService& service, std::string repository)
        : service_(service), repository_(std::move(repository)) {}

    void registerRoutes(ServerApp& app) override {
        CROW_ROUTE(app, "/health").methods("GET"_method)([]() {
            return ResponseBuilder::health();
        });

        // Source listing
        CROW_ROUTE(app, "/api/source/installed")
            .methods("GET"_method)([this](const crow::request& req) {
                return installed(req);
            });

        CROW_ROUTE(app, "/api/source/available")
            .methods("GET"_method)([this](const crow::request& req) {
                return available(req);
            });

        CROW_ROUTE(app, "/api/source/<int>")
            .methods("GET"_method)([this](const crow::request& req,
                                          int64_t id) {
                return getSource(req, id);
            });

        // Lifecycle
        CROW_ROUTE(app, "/api/source/<int>/install")
            .methods("POST"_method)([this](const crow::request& req,
                                           int64_t id) {
                return install(req, id);
            });

        CROW_ROUTE(app, "/api/source/<int>/update")
            .methods("PUT"_method)([this](const crow::request& req,
                                          int64_t id) {
                return update(req, id);
            });

        CROW_ROUTE(app, "/api/source/<int>/uninstall")
            .methods("DELETE"_method)([this](const crow::request& req,
                                             int64_t id) {
                return uninstall(req, id);
            });

        // Catalog
        CROW_ROUTE(app, "/api/source/<int>/popular")
            .methods("GET"_method)([this](const crow::request& req,
                                          int64_t id) {
                return popular(req, id);
            });

        CROW_ROUTE(app, "/api/source/<int>/latest")
            .methods("GET"_method)([this](const crow::request& req,
                                          int64_t id) {
                return latest(req, id);
            });

        CROW_ROUTE(app, "/api/source/<int>/search")
            .methods("POST"_method)([this](const crow::request& req,
                                           int64_t id) {
                return search(req, id);
            });

        CROW_ROUTE(app, "/api/source/<int>/manga")
            .methods("GET"_method)([this](const crow::request& req,
                                          int64_t id) {
                return manga(req, id);
            });

        CROW_ROUTE(app, "/api/source/<int>/chapters")
            .methods("GET"_method)([this](const crow::request& req,
                                          int64_t id) {
                return chapters(req, id);
            });

        CROW_ROUTE(app, "/api/source/<int>/pages")
            .methods("GET"_method)([this](const crow::request& req,
                                          int64_t id) {
                return pages(req, id);
            });
    }

    // Route handlers

    crow::response installed(const crow::request& req) {
        return guarded("installed", [&] {
            if (parseCheckUpdate(req.url_params.get("check_update"))) {
                return respond(service_.installedSourcesWithUpdates(repository_));
            }
            return ResponseBuilder::success(
                toJsonArray(service_.installedSources()));
        });
    }

    crow::response available(const crow::request& /*req*/) {
        return guarded("available", [&] {
            return respond(service_.availableSources(repository_));
        });
    }

    crow::response getSource(const crow::request& /*req*/, int64_t id) {
        return guarded("getSource", [&] {
            return respond(service_.getSourceById(id));
        });
    }

    crow::response install(const crow::request& /*req*/, int64_t id) {
        return guarded("install", [&] {
            auto result = service_.installSource(repository_, id);
            if (!result) {
                return respond(result);
            }
            return ResponseBuilder::successWithMessage("source installed",
                                                       result->toJson(), 201);
        });
    }

    crow::response update(const crow::request& /*req*/, int64_t id) {
        return guarded("update", [&] {
            auto result = service_.updateSource(repository_, id);
            if (!result) {
                return respond(result);
            }
            return ResponseBuilder::successWithMessage("source updated",
                                                       result->toJson());
        });
    }

    crow::response uninstall(const crow::request& /*req*/, int64_t id) {
        return guarded("uninstall", [&] {
            auto result = service_.uninstallSource(id);
            if (!result) {
                LOG_WARN("Uninstall of source {} failed: {}", id,
                         result.error().describe());
                return ResponseBuilder::fromError(result.error());
            }
            return ResponseBuilder::successWithMessage("source uninstalled");
        });
    }

    crow::response popular(const crow::request& req, int64_t id) {
        return guarded("popular", [&] {
            auto page = parsePage(req.url_params.get("page"));
            if (!page) {
                return ResponseBuilder::invalidFieldValue("page",
                                                          "positive integer");
            }
            return respond(service_.getPopularManga(id, *page));
        });
    }

    crow::response latest(const crow::request& req, int64_t id) {
        return guarded("latest", [&] {
            auto page = parsePage(req.url_params.get("page"));
            if (!page) {
                return ResponseBuilder::invalidFieldValue("page",
                                                          "positive integer");
            }
            return respond(service_.getLatestManga(id, *page));
        });
    }

    crow::response search(const crow::request& req, int64_t id) {
        return guarded("search", [&] {
            auto page = parsePage(req.url_params.get("page"));
            if (!page) {
                return ResponseBuilder::invalidFieldValue("page",
                                                          "positive integer");
            }

            auto body = parseSearchBody(req.body);
            if (!body) {
                return badBody(body.error());
            }
            return respond(service_.searchManga(id, *page, body->query,
                                                body->filters));
        });
    }

    crow::response manga(const crow::request& req, int64_t id) {
        return guarded("manga", [&] {
            auto path = parsePath(req.url_params.get("path"));
            if (!path) {
                return ResponseBuilder::missingField("path");
            }
            return respond(service_.getMangaBySourcePath(id, *path));
        });
    }

    crow::response chapters(const crow::request& req, int64_t id) {
        return guarded("chapters", [&] {
            auto path = parsePath(req.url_params.get("path"));
            if (!path) {
                return ResponseBuilder::missingField("path");
            }
            return respond(service_.getChaptersBySourcePath(id, *path));
        });
    }

    crow::response pages(const crow::request& req, int64_t id) {
        return guarded("pages", [&] {
            auto path = parsePath(req.url_params.get("path"));
            if (!path) {
                return ResponseBuilder::missingField("path");
            }
            return respond(service_.getPagesBySourcePath(id, *path));
        });
    }

private:
    extension::SourceService& service_;
    std::string repository_;

    static auto guarded(const std::string& action,
                        const std::function<crow::response()>& func)
        -> crow::response {
        try {
            return func();
        } catch (const std::exception& e) {
            LOG_ERROR("Exception while handling {}: {}", action, e.what());
            return ResponseBuilder::internalError(e.what());
        }
    }

    template <typename T>
    static auto toJsonArray(const std::vector<T>& records) -> nlohmann::json {
        auto array = nlohmann::json::array();
        for (const auto& record : records) {
            array.push_back(record.toJson());
        }
        return array;
    }

    template <typename T>
    static auto respond(const extension::ExtensionResult<T>& result)
        -> crow::response {
        if (!result) {
            LOG_WARN("Source request failed: {}", result.error().describe());
            return ResponseBuilder::fromError(result.error());
        }
        if constexpr (std::is_same_v<T, extension::PageList>) {
            return ResponseBuilder::success(*result);
        } else if constexpr (requires { result->toJson(); }) {
            return ResponseBuilder::success(result->toJson());
        } else {
            return ResponseBuilder::success(toJsonArray(*result));
        }
    }

    static auto badBody(const BodyError& error) -> crow::response {
        if (error.kind == BodyError::Kind::InvalidJson) {
            return ResponseBuilder::invalidJson(error.constraint);
        }
        return ResponseBuilder::invalidFieldValue(error.field,
                                                  error.constraint);
    }
};

}  // namespace shiori::server::controller

#endif  // SHIORI_SERVER_CONTROLLER_SOURCE_HPP
