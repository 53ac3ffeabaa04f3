#pragma once

#include <ctime>
#include <stdexcept>
#include <string>

#include <crow.h>
#include <nlohmann/json.hpp>

#include "../core/value_json.hpp"
#include "../core/vector.hpp"
#include "../storage/kv_store.hpp"
#include "../utils/log.hpp"
#include "../utils/settings.hpp"

namespace svec {
    namespace server {

        // Helper function to send JSON bodies
        inline crow::response json_response(int code, const nlohmann::json& body) {
            crow::response res(code, body.dump());
            res.set_header("Content-Type", "application/json");
            return res;
        }

        // Helper function to send error messages in JSON format
        inline crow::response json_error(int code, const std::string& message) {
            crow::json::wvalue err_json({{"error", message}});
            crow::response res(code, err_json.dump());
            res.set_header("Content-Type", "application/json");
            return res;
        }

        // Special helper function to log and send error messages in JSON format for 500 errors
        inline crow::response json_error_500(const std::string& path, const std::string& message) {
            LOG_ERROR("500 Error | path: " << path << " | message: " << message);
            return json_error(500, message);
        }

        // Vectors served over http all live under the same directory and share the
        // configured default
        inline Vector open_vector(const std::string& name) {
            return Vector(Subspace::fromPath({settings::VECTORS_DIRECTORY, name}),
                          Value(settings::DEFAULT_VALUE));
        }

        // Reads {"value": ...} from a request body
        inline Value parse_value_body(const crow::request& req) {
            nlohmann::json body = nlohmann::json::parse(req.body);
            if(!body.is_object() || !body.contains("value")) {
                throw std::invalid_argument("Missing required parameter: value");
            }
            return body["value"].get<Value>();
        }

        inline int64_t query_int(const crow::request& req, const char* name, int64_t fallback) {
            const char* raw = req.url_params.get(name);
            if(!raw) {
                return fallback;
            }
            return std::stoll(raw);
        }

        // Maps the error hierarchy onto http status codes
        template <typename Handler>
        crow::response guarded(const crow::request& req, Handler&& handler) {
            try {
                return handler();
            } catch(const InvalidIndexError& e) {
                return json_error(400, e.what());
            } catch(const UnsupportedTypeError& e) {
                return json_error(400, e.what());
            } catch(const OutOfRangeError& e) {
                return json_error(404, e.what());
            } catch(const nlohmann::json::exception& e) {
                return json_error(400, std::string("Invalid JSON: ") + e.what());
            } catch(const std::invalid_argument& e) {
                return json_error(400, e.what());
            } catch(const std::out_of_range& e) {
                return json_error(400, std::string("Parameter out of range: ") + e.what());
            } catch(const std::exception& e) {
                return json_error_500(req.url, e.what());
            }
        }

        /**
         * Registers every /api/v1 route on app. store must outlive app.
         */
        inline void register_routes(crow::SimpleApp& app, KVStore& store) {
            // Health check endpoint
            CROW_ROUTE(app, "/api/v1/health").methods("GET"_method)([]() {
                return json_response(200, {{"status", "ok"}, {"timestamp", std::time(nullptr)}});
            });

            CROW_ROUTE(app, "/api/v1/stats").methods("GET"_method)([&store]() {
                return json_response(200,
                                     {{"name", settings::NAME},
                                      {"version", settings::VERSION},
                                      {"data_dir", store.path()},
                                      {"default_value", settings::DEFAULT_VALUE}});
            });

            CROW_ROUTE(app, "/api/v1/vectors/<string>/size")
                    .methods("GET"_method)([&store](const crow::request& req, std::string name) {
                        return guarded(req, [&]() {
                            Vector vector = open_vector(name);
                            auto size = store.read([&](Transaction& tr) { return vector.size(tr); });
                            return json_response(200, {{"size", size}});
                        });
                    });

            CROW_ROUTE(app, "/api/v1/vectors/<string>/items/<int>")
                    .methods("GET"_method)(
                            [&store](const crow::request& req, std::string name, int64_t index) {
                                return guarded(req, [&]() {
                                    Vector vector = open_vector(name);
                                    Value value = store.read(
                                            [&](Transaction& tr) { return vector.get(index, tr); });
                                    return json_response(200, {{"index", index}, {"value", value}});
                                });
                            });

            CROW_ROUTE(app, "/api/v1/vectors/<string>/items/<int>")
                    .methods("PUT"_method)(
                            [&store](const crow::request& req, std::string name, int64_t index) {
                                return guarded(req, [&]() {
                                    Vector vector = open_vector(name);
                                    Value value = parse_value_body(req);
                                    LOG_DEBUG("set " << name << "[" << index << "] = " << value);
                                    store.transact(
                                            [&](Transaction& tr) { vector.set(index, value, tr); });
                                    return json_response(200, {{"index", index}, {"value", value}});
                                });
                            });

            CROW_ROUTE(app, "/api/v1/vectors/<string>/push")
                    .methods("POST"_method)([&store](const crow::request& req, std::string name) {
                        return guarded(req, [&]() {
                            Vector vector = open_vector(name);
                            Value value = parse_value_body(req);
                            auto size = store.transact([&](Transaction& tr) {
                                vector.push(value, tr);
                                return vector.size(tr);
                            });
                            return json_response(200, {{"size", size}});
                        });
                    });

            CROW_ROUTE(app, "/api/v1/vectors/<string>/pop")
                    .methods("POST"_method)([&store](const crow::request& req, std::string name) {
                        return guarded(req, [&]() {
                            Vector vector = open_vector(name);
                            Value value =
                                    store.transact([&](Transaction& tr) { return vector.pop(tr); });
                            return json_response(200, {{"value", value}});
                        });
                    });

            CROW_ROUTE(app, "/api/v1/vectors/<string>/front")
                    .methods("GET"_method)([&store](const crow::request& req, std::string name) {
                        return guarded(req, [&]() {
                            Vector vector = open_vector(name);
                            Value value = store.read([&](Transaction& tr) { return vector.front(tr); });
                            return json_response(200, {{"value", value}});
                        });
                    });

            CROW_ROUTE(app, "/api/v1/vectors/<string>/back")
                    .methods("GET"_method)([&store](const crow::request& req, std::string name) {
                        return guarded(req, [&]() {
                            Vector vector = open_vector(name);
                            Value value = store.read([&](Transaction& tr) { return vector.back(tr); });
                            return json_response(200, {{"value", value}});
                        });
                    });

            CROW_ROUTE(app, "/api/v1/vectors/<string>/range")
                    .methods("GET"_method)([&store](const crow::request& req, std::string name) {
                        return guarded(req, [&]() {
                            LOG_TIME("range");
                            Vector vector = open_vector(name);
                            int64_t start = query_int(req, "start", 0);
                            int64_t stop = query_int(req, "stop", 0);
                            int64_t step = query_int(req, "step", 0);

                            nlohmann::json items = nlohmann::json::array();
                            bool truncated = store.read([&](Transaction& tr) {
                                auto it = vector.getRange(
                                        start, stop, step < 0 ? -1 : (step > 0 ? 1 : 0), tr);
                                while(it.advance()) {
                                    if(items.size() >= settings::MAX_RANGE_ITEMS) {
                                        return true;
                                    }
                                    items.push_back(nlohmann::json(it.entry()));
                                }
                                return false;
                            });
                            return json_response(200, {{"items", items}, {"truncated", truncated}});
                        });
                    });

            CROW_ROUTE(app, "/api/v1/vectors/<string>")
                    .methods("DELETE"_method)([&store](const crow::request& req, std::string name) {
                        return guarded(req, [&]() {
                            Vector vector = open_vector(name);
                            store.transact([&](Transaction& tr) { vector.clear(tr); });
                            LOG_INFO("Cleared vector " << name);
                            return json_response(200, {{"cleared", name}});
                        });
                    });
        }

    }  // namespace server
}  // namespace svec
