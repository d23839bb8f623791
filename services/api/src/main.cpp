#include <csignal>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <microhttpd.h>
#include "../include/routes.hpp"
#include "../../../agents/rag/include/config.hpp"
#include "../../../agents/rag/include/llama_server.hpp"
#include "../../../agents/rag/include/log.hpp"
#include "../../../agents/rag/include/ollama.hpp"
#include "../../../agents/rag/include/pdf_text.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "application/json");
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* api = static_cast<ApiService*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    log_debug("api", ci->method + " " + ci->url);
    auto r = api->handle(ci->method, ci->url, ci->body);
    return send_response(connection, r.status, r.body);
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

int main(int, char**) {
    AppConfig cfg;
    try {
        cfg = load_config_from_env();
        set_log_level(parse_log_level(cfg.log_level));
    } catch (const std::exception& e) {
        std::cerr << "[api] Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    try {
        PopplerTextExtractor extractor;
        auto source = make_document_source(cfg.source, extractor);
        OllamaEmbedder embedder(cfg.embed);
        LlamaServerModel model(cfg.llm);
        RagPipeline pipeline(*source, embedder, model, pipeline_options(cfg));

        auto parent = std::filesystem::path(cfg.db_path).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);
        CorpusStore store(cfg.db_path);
        if (auto snap = store.load()) {
            pipeline.load_snapshot(snap);
            log_info("api", "Loaded corpus: " + std::to_string(snap->papers.size()) + " paper(s), " +
                            std::to_string(snap->chunks.size()) + " chunk(s).");
            if (snap->embed_model != embedder.model()) {
                log_warn("api", "corpus was embedded with '" + snap->embed_model + "' but '" + embedder.model() +
                                "' is configured.");
            }
        }

        ApiDefaults defaults;
        defaults.max_documents = cfg.max_documents;
        defaults.top_k = cfg.top_k;
        ApiService api(pipeline, &store, defaults);

        log_info("api", "Starting HTTP server on port " + std::to_string(cfg.api_port) + "...");
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)cfg.api_port,
                                                nullptr, nullptr, &handler, &api,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_THREAD_POOL_SIZE, (unsigned int)4,
                                                MHD_OPTION_END);
        if (!d) {
            log_error("api", "Failed to start HTTP server");
            return 1;
        }
        std::signal(SIGTERM, [](int){});
        std::signal(SIGINT, [](int){});
        pause();
        log_info("api", "Shutting down.");
        MHD_stop_daemon(d);
        return 0;
    } catch (const std::exception& e) {
        log_error("api", e.what());
        return 1;
    }
}
