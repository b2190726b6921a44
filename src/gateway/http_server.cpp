#include "http_server.hpp"
#include "request_codec.hpp"
#include "../admin/admin_client.hpp"
#include "crow.h"
#include <iostream>

HttpServer::HttpServer(std::shared_ptr<AdminClient> admin)
    : admin_(admin) {}

static crow::response jsonResponse(int code, crow::json::wvalue body) {
    crow::response res(code, body.dump());
    res.add_header("Content-Type", "application/json");
    return res;
}

static crow::response errorResponse(int code, const std::string& message) {
    return jsonResponse(code, RequestCodec::encodeError(message));
}

crow::response HttpServer::respond(const std::function<crow::response()>& handler) {
    try {
        return handler();
    } catch (const ValidationError& e) {
        return errorResponse(400, e.what());
    } catch (const DeleteGroupsError& e) {
        crow::json::wvalue body = RequestCodec::encodeError(e.what());
        body["groups"] = RequestCodec::encode(e.failures());
        return jsonResponse(502, std::move(body));
    } catch (const KafkaProtocolError& e) {
        crow::json::wvalue body = RequestCodec::encodeError(e.what());
        body["type"] = errorTypeName(e.type());
        body["code"] = e.code();
        return jsonResponse(502, std::move(body));
    } catch (const TimeoutError& e) {
        return errorResponse(504, e.what());
    } catch (const NonRetriableError& e) {
        return errorResponse(409, e.what());
    } catch (const std::exception& e) {
        std::cerr << "Admin request failed: " << e.what() << std::endl;
        return errorResponse(500, e.what());
    }
}

void HttpServer::setupRoutes(crow::SimpleApp& app) {
    auto admin = admin_;  // Capture for lambda

    // Health check endpoint for Kubernetes liveness checks
    CROW_ROUTE(app, "/health")
        ([](){
            return crow::response(200, "OK");
        });

    // Readiness check endpoint for Kubernetes readiness checks
    CROW_ROUTE(app, "/ready")
        ([admin](){
            if (!admin || !admin->isConnected()) {
                return crow::response(503, "Admin client not connected");
            }
            return crow::response(200, "OK");
        });

    CROW_ROUTE(app, "/v1/cluster")
        ([admin](){
            return respond([&]() {
                return jsonResponse(200, RequestCodec::encode(admin->describeCluster()));
            });
        });

    CROW_ROUTE(app, "/v1/topics")
        .methods("GET"_method, "POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                if (req.method == "GET"_method) {
                    crow::json::wvalue body;
                    crow::json::wvalue::list topics;
                    for (const auto& topic : admin->listTopics()) {
                        topics.push_back(crow::json::wvalue(topic));
                    }
                    body["topics"] = std::move(topics);
                    return jsonResponse(200, std::move(body));
                }
                auto request = RequestCodec::decodeCreateTopics(RequestCodec::parseBody(req.body));
                crow::json::wvalue body;
                body["created"] = admin->createTopics(request);
                return jsonResponse(200, std::move(body));
            });
        });

    CROW_ROUTE(app, "/v1/topics/delete")
        .methods("POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                admin->deleteTopics(RequestCodec::decodeDeleteTopics(RequestCodec::parseBody(req.body)));
                return crow::response(204);
            });
        });

    CROW_ROUTE(app, "/v1/topics/partitions")
        .methods("POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                auto request = RequestCodec::decodeCreatePartitions(RequestCodec::parseBody(req.body));
                crow::json::wvalue body;
                body["created"] = admin->createPartitions(request);
                return jsonResponse(200, std::move(body));
            });
        });

    CROW_ROUTE(app, "/v1/topics/metadata")
        .methods("POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                auto topics = RequestCodec::decodeTopicNames(RequestCodec::parseBody(req.body));
                return jsonResponse(200, RequestCodec::encode(admin->fetchTopicMetadata(topics)));
            });
        });

    CROW_ROUTE(app, "/v1/topics/<string>/offsets")
        ([admin](const std::string& topic){
            return respond([&]() {
                return jsonResponse(200, RequestCodec::encode(admin->fetchTopicOffsets(topic)));
            });
        });

    CROW_ROUTE(app, "/v1/groups")
        ([admin](){
            return respond([&]() {
                return jsonResponse(200, RequestCodec::encode(admin->listGroups()));
            });
        });

    CROW_ROUTE(app, "/v1/groups/delete")
        .methods("POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                auto group_ids = RequestCodec::decodeGroupIds(RequestCodec::parseBody(req.body));
                return jsonResponse(200, RequestCodec::encode(admin->deleteGroups(group_ids)));
            });
        });

    CROW_ROUTE(app, "/v1/groups/<string>/offsets")
        .methods("GET"_method, "POST"_method)
        ([admin](const crow::request& req, const std::string& group_id){
            return respond([&]() {
                if (req.method == "GET"_method) {
                    const char* topic = req.url_params.get("topic");
                    return jsonResponse(200, RequestCodec::encode(
                        admin->fetchOffsets(group_id, topic ? topic : "")));
                }
                auto body = RequestCodec::parseBody(req.body);
                std::string topic = body.t() == crow::json::type::Object && body.has("topic") &&
                                            body["topic"].t() == crow::json::type::String
                                        ? std::string(body["topic"].s())
                                        : std::string();
                admin->setOffsets(group_id, topic, RequestCodec::decodeSetOffsets(body));
                return crow::response(204);
            });
        });

    CROW_ROUTE(app, "/v1/groups/<string>/offsets/reset")
        .methods("POST"_method)
        ([admin](const crow::request& req, const std::string& group_id){
            return respond([&]() {
                auto body = RequestCodec::parseBody(req.body);
                std::string topic;
                bool earliest = false;
                if (body.t() == crow::json::type::Object) {
                    if (body.has("topic") && body["topic"].t() == crow::json::type::String) {
                        topic = std::string(body["topic"].s());
                    }
                    earliest = body.has("earliest") && body["earliest"].t() == crow::json::type::True;
                }
                admin->resetOffsets(group_id, topic, earliest);
                return crow::response(204);
            });
        });

    CROW_ROUTE(app, "/v1/configs/describe")
        .methods("POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                auto body = RequestCodec::parseBody(req.body);
                bool include_synonyms = body.t() == crow::json::type::Object && body.has("includeSynonyms") &&
                                        body["includeSynonyms"].t() == crow::json::type::True;
                auto resources = RequestCodec::decodeDescribeConfigs(body);
                return jsonResponse(200, RequestCodec::encode(admin->describeConfigs(resources, include_synonyms)));
            });
        });

    CROW_ROUTE(app, "/v1/configs/alter")
        .methods("POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                auto body = RequestCodec::parseBody(req.body);
                bool validate_only = body.t() == crow::json::type::Object && body.has("validateOnly") &&
                                     body["validateOnly"].t() == crow::json::type::True;
                auto resources = RequestCodec::decodeAlterConfigs(body);
                return jsonResponse(200, RequestCodec::encode(admin->alterConfigs(resources, validate_only)));
            });
        });

    CROW_ROUTE(app, "/v1/acls")
        .methods("POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                auto acl = RequestCodec::decodeCreateAcls(RequestCodec::parseBody(req.body));
                crow::json::wvalue body;
                body["created"] = admin->createAcls(acl);
                return jsonResponse(200, std::move(body));
            });
        });

    CROW_ROUTE(app, "/v1/acls/describe")
        .methods("POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                auto filter = RequestCodec::decodeAclFilter(RequestCodec::parseBody(req.body));
                return jsonResponse(200, RequestCodec::encode(admin->describeAcls(filter)));
            });
        });

    CROW_ROUTE(app, "/v1/acls/delete")
        .methods("POST"_method)
        ([admin](const crow::request& req){
            return respond([&]() {
                auto filters = RequestCodec::decodeDeleteAcls(RequestCodec::parseBody(req.body));
                return jsonResponse(200, RequestCodec::encode(admin->deleteAcls(filters)));
            });
        });
}

void HttpServer::start(const std::string& host, int port) {
    crow::SimpleApp app;
    setupRoutes(app);

    std::cout << "Kafka Admin Gateway is running at http://" << host << ":" << port << std::endl;
    app.bindaddr(host).port(port).multithreaded().run();
}
