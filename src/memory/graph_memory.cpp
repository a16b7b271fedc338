#include "graph_memory.hpp"
#include "../errors.hpp"
#include "../event_bus.hpp"
#include "../generator.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <stdexcept>
#include <unordered_set>

using json = nlohmann::json;

namespace graphmem {

// ── Queries ────────────────────────────────────────────────────

static const char* kInsertNode =
    "INSERT INTO nodes (id, label, session_id, created_at, expires_at, properties) "
    "VALUES (?, ?, ?, ?, ?, ?);";

static const char* kInsertNodeIfAbsent =
    "INSERT OR IGNORE INTO nodes (id, label, session_id, created_at, expires_at, properties) "
    "VALUES (?, ?, ?, ?, ?, ?);";

static const char* kInsertEdge =
    "INSERT OR IGNORE INTO edges (source, target, relation, properties) "
    "VALUES (?, ?, ?, ?);";

// NEXT from the latest earlier message of the session, if any.
static const char* kLinkPrevious =
    "INSERT OR IGNORE INTO edges (source, target, relation, properties) "
    "SELECT id, ?, 'NEXT', '{}' FROM nodes "
    "WHERE label = 'ShortTermMessage' AND session_id = ? AND id <> ? AND created_at < ? "
    "ORDER BY created_at DESC LIMIT 1;";

static const char* kSelectLiveMessages =
    "SELECT id, label, properties FROM nodes "
    "WHERE label = 'ShortTermMessage' AND session_id = ? AND expires_at > ? "
    "ORDER BY created_at;";

static const char* kSelectLastTimestamp =
    "SELECT MAX(created_at) AS last_ts FROM nodes "
    "WHERE label = 'ShortTermMessage' AND session_id = ?;";

static const char* kSelectPurgeable =
    "SELECT id, session_id FROM nodes "
    "WHERE label = 'ShortTermMessage' AND expires_at <= ? "
    "AND id NOT IN (SELECT source FROM edges WHERE relation = 'CONTRIBUTED_TO');";

static const char* kSelectChain =
    "SELECT id FROM nodes WHERE label = 'ShortTermMessage' AND session_id = ? "
    "ORDER BY created_at;";

// ── Statement builders ─────────────────────────────────────────

static Statement node_statement(const char* query, const std::string& id,
                                const std::string& label, const std::string& session_id,
                                int64_t created_at, const json& expires_at,
                                const json& properties) {
    return Statement{query, json::array({id, label, session_id, created_at,
                                         expires_at, properties})};
}

static Statement session_statement(const std::string& session_id, int64_t created_at) {
    return node_statement(kInsertNodeIfAbsent, session_node_id(session_id),
                          labels::ChatSession, session_id, created_at, nullptr,
                          json{{"session_id", session_id}, {"created_at", created_at}});
}

static Statement edge_statement(const std::string& source, const std::string& target,
                                const std::string& relation,
                                const json& properties = json::object()) {
    return Statement{kInsertEdge, json::array({source, target, relation, properties})};
}

static Statement link_previous_statement(const ShortTermMessage& msg) {
    return Statement{kLinkPrevious,
                     json::array({msg.id, msg.session_id, msg.id, msg.created_at})};
}

// Session node, message node, HAS_MESSAGE and NEXT. Idempotent, so a
// reconcile that races a successful write cannot duplicate anything.
static void append_message_statements(std::vector<Statement>& out, const ShortTermMessage& msg) {
    GraphNode node = message_to_node(msg);
    out.push_back(session_statement(msg.session_id, msg.created_at));
    out.push_back(node_statement(kInsertNodeIfAbsent, msg.id, labels::ShortTermMessage,
                                 msg.session_id, msg.created_at, msg.expires_at,
                                 node.properties));
    out.push_back(edge_statement(session_node_id(msg.session_id), msg.id, relations::HasMessage));
    out.push_back(link_previous_statement(msg));
}

static json parse_properties(const json& row, const char* column) {
    if (!row.contains(column) || !row[column].is_string()) return json::object();
    json props = json::parse(row[column].get<std::string>(), nullptr, false);
    if (props.is_discarded() || !props.is_object()) return json::object();
    return props;
}

static GraphNode node_from_row(const json& row) {
    GraphNode node;
    node.id = row.value("id", "");
    node.label = row.value("label", "");
    node.properties = parse_properties(row, "properties");
    return node;
}

static GraphEdge edge_from_row(const json& row) {
    GraphEdge edge;
    edge.source = row.value("source", "");
    edge.target = row.value("target", "");
    edge.relation = row.value("relation", "");
    edge.properties = parse_properties(row, "properties");
    return edge;
}

static std::vector<DialogueTurn> to_transcript(const std::vector<ShortTermMessage>& messages) {
    std::vector<DialogueTurn> transcript;
    transcript.reserve(messages.size());
    for (const auto& m : messages) transcript.push_back({m.role, m.content});
    return transcript;
}

// ── GraphMemoryService ─────────────────────────────────────────

GraphMemoryService::GraphMemoryService(GraphStore& store,
                                       FallbackCache& cache,
                                       Summarizer& summarizer,
                                       const MemoryConfig& memory_config,
                                       const StoreConfig& store_config,
                                       EventBus* bus,
                                       Clock clock)
    : store_(store),
      cache_(cache),
      summarizer_(summarizer),
      bus_(bus),
      clock_(clock ? std::move(clock) : Clock(epoch_millis)),
      ttl_minutes_(memory_config.short_term_ttl_minutes),
      health_(store_config.retry_backoff_ms) {}

std::shared_ptr<GraphMemoryService::SessionState>
GraphMemoryService::session_state(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto& st = sessions_[session_id];
    if (!st) st = std::make_shared<SessionState>();
    return st;
}

void GraphMemoryService::note_success() {
    if (!health_.mark_success()) return;
    size_t pending = cache_.size();
    std::cerr << "[memory] Graph store reachable again";
    if (pending > 0) std::cerr << ", " << pending << " cached messages to reconcile";
    std::cerr << "\n";

    StoreHealthChangedEvent ev;
    ev.reachable = true;
    ev.pending = pending;
    publish(bus_, ev);
    reconcile_pending_ = true;
}

void GraphMemoryService::note_failure(const std::string& reason) {
    if (!health_.mark_failure(reason, clock_())) return;
    std::cerr << "[memory] Graph store unreachable, using fallback cache: " << reason << "\n";

    StoreHealthChangedEvent ev;
    ev.reachable = false;
    ev.reason = reason;
    ev.pending = cache_.size();
    publish(bus_, ev);
}

void GraphMemoryService::maybe_reconcile() {
    if (reconcile_pending_.load() && health_.should_attempt(clock_())) reconcile();
}

void GraphMemoryService::load_tail(SessionState& st, const std::string& session_id) {
    if (st.tail_loaded) return;
    auto rows = store_.read(kSelectLastTimestamp, json::array({session_id}));
    if (!rows.empty() && rows[0].contains("last_ts") && rows[0]["last_ts"].is_number_integer()) {
        st.last_ts = std::max(st.last_ts, rows[0]["last_ts"].get<int64_t>());
    }
    st.tail_loaded = true;
}

size_t GraphMemoryService::flush_session(const std::string& session_id) {
    auto entries = cache_.session_entries(session_id, clock_(), /*include_expired=*/true);
    if (entries.empty()) return 0;

    std::vector<Statement> stmts;
    std::vector<std::string> ids;
    stmts.reserve(entries.size() * 4);
    ids.reserve(entries.size());
    for (const auto& m : entries) {
        append_message_statements(stmts, m);
        ids.push_back(m.id);
    }
    store_.write_batch(stmts);
    cache_.remove(session_id, ids);

    std::cerr << "[memory] Flushed " << entries.size()
              << " cached messages for session " << session_id << "\n";
    return entries.size();
}

std::vector<ShortTermMessage> GraphMemoryService::live_messages(const std::string& session_id,
                                                                int64_t now_ms, bool durable) {
    std::vector<ShortTermMessage> out;
    std::unordered_set<std::string> seen;

    if (durable || health_.should_attempt(now_ms)) {
        try {
            flush_session(session_id);
            auto rows = store_.read(kSelectLiveMessages, json::array({session_id, now_ms}));
            for (const auto& row : rows) {
                auto msg = message_from_node(node_from_row(row));
                seen.insert(msg.id);
                out.push_back(std::move(msg));
            }
            note_success();
        } catch (const StorageUnavailableError& e) {
            note_failure(e.what());
            if (durable) throw;
        } catch (const std::exception& e) {
            if (durable) throw;
            note_failure(e.what());
        }
    }

    for (auto& m : cache_.session_entries(session_id, now_ms, /*include_expired=*/false)) {
        if (seen.count(m.id) == 0) out.push_back(std::move(m));
    }
    std::stable_sort(out.begin(), out.end(),
        [](const ShortTermMessage& a, const ShortTermMessage& b) {
            return a.created_at < b.created_at;
        });
    return out;
}

// ── record_message ─────────────────────────────────────────────

ShortTermMessage GraphMemoryService::record_message(const std::string& session_id,
                                                    const std::string& role,
                                                    const std::string& content) {
    if (session_id.empty()) throw std::invalid_argument("session_id must not be empty");
    if (role.empty()) throw std::invalid_argument("role must not be empty");

    ShortTermMessage msg;
    {
        std::shared_lock<std::shared_mutex> guard(reset_mutex_);
        auto st = session_state(session_id);
        std::lock_guard<std::mutex> lock(st->mutex);

        int64_t now = clock_();
        bool attempt = health_.should_attempt(now);
        if (attempt && !st->tail_loaded) {
            try {
                load_tail(*st, session_id);
            } catch (const std::exception& e) {
                note_failure(e.what());
                attempt = false;
            }
        }

        int64_t floor = std::max(st->last_ts, cache_.last_timestamp(session_id));
        msg.id = new_message_id();
        msg.session_id = session_id;
        msg.role = role;
        msg.content = content;
        msg.created_at = std::max(now, floor + 1);
        msg.expires_at = msg.created_at + ttl_ms();
        st->last_ts = msg.created_at;

        bool stored = false;
        if (attempt) {
            try {
                // Older cached messages go first so NEXT follows timestamps.
                flush_session(session_id);
                std::vector<Statement> stmts;
                append_message_statements(stmts, msg);
                store_.write_batch(stmts);
                note_success();
                stored = true;
            } catch (const std::exception& e) {
                note_failure(e.what());
            }
        }
        if (!stored) {
            msg.degraded = true;
            cache_.append(msg, now);
        }
    }

    MessageRecordedEvent ev;
    ev.session_id = session_id;
    ev.message_id = msg.id;
    ev.role = role;
    ev.degraded = msg.degraded;
    publish(bus_, ev);

    maybe_reconcile();
    return msg;
}

// ── consolidate ────────────────────────────────────────────────

Knowledge GraphMemoryService::consolidate(const std::string& session_id,
                                          const std::optional<std::string>& note) {
    if (session_id.empty()) throw std::invalid_argument("session_id must not be empty");

    Knowledge knowledge;
    {
        // Held shared for the whole call so a purge cannot delete a source
        // between selection and the knowledge write.
        std::shared_lock<std::shared_mutex> guard(reset_mutex_);

        std::vector<ShortTermMessage> sources;
        {
            auto st = session_state(session_id);
            std::lock_guard<std::mutex> lock(st->mutex);
            sources = live_messages(session_id, clock_(), /*durable=*/true);
        }
        if (sources.empty()) throw NoMessagesError(session_id);

        std::string summary = summarizer_.summarize(to_transcript(sources), note);

        knowledge.id = new_knowledge_id();
        knowledge.session_id = session_id;
        knowledge.summary = summary;
        knowledge.note = note;
        knowledge.created_at = clock_();
        for (const auto& m : sources) knowledge.source_ids.push_back(m.id);

        json props = {
            {"session_id", session_id},
            {"summary", summary},
            {"created_at", knowledge.created_at},
            {"source_count", sources.size()}
        };
        if (note) props["note"] = *note;

        std::vector<Statement> stmts;
        stmts.push_back(session_statement(session_id, knowledge.created_at));
        stmts.push_back(node_statement(kInsertNode, knowledge.id, labels::Knowledge,
                                       session_id, knowledge.created_at, nullptr, props));
        stmts.push_back(edge_statement(session_node_id(session_id), knowledge.id,
                                       relations::Yielded));
        for (const auto& id : knowledge.source_ids) {
            stmts.push_back(edge_statement(id, knowledge.id, relations::ContributedTo));
        }

        try {
            store_.write_batch(stmts);
            note_success();
        } catch (const StorageUnavailableError& e) {
            note_failure(e.what());
            throw;
        }
    }

    std::cerr << "[memory] Consolidated " << knowledge.source_ids.size()
              << " messages of session " << session_id << " into " << knowledge.id << "\n";

    KnowledgeCreatedEvent ev;
    ev.session_id = session_id;
    ev.knowledge_id = knowledge.id;
    ev.source_count = knowledge.source_ids.size();
    publish(bus_, ev);

    maybe_reconcile();
    return knowledge;
}

// ── history ────────────────────────────────────────────────────

std::vector<ShortTermMessage> GraphMemoryService::history(const std::string& session_id) {
    std::vector<ShortTermMessage> out;
    {
        std::shared_lock<std::shared_mutex> guard(reset_mutex_);
        auto st = session_state(session_id);
        std::lock_guard<std::mutex> lock(st->mutex);
        out = live_messages(session_id, clock_(), /*durable=*/false);
    }
    maybe_reconcile();
    return out;
}

// ── export_graph ───────────────────────────────────────────────

GraphView GraphMemoryService::export_graph(const ExportFilter& filter) {
    GraphView view;
    std::unordered_set<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> guard(reset_mutex_);
        int64_t now = clock_();

        if (health_.should_attempt(now)) {
            try {
                std::string node_sql = "SELECT id, label, properties FROM nodes";
                std::string edge_sql = "SELECT source, target, relation, properties FROM edges";
                json node_params = json::array();
                json edge_params = json::array();
                std::vector<std::string> where;

                if (filter.session_id) {
                    where.push_back("session_id = ?");
                    node_params.push_back(*filter.session_id);
                    edge_sql = "SELECT e.source, e.target, e.relation, e.properties FROM edges e "
                               "JOIN nodes s ON s.id = e.source "
                               "JOIN nodes t ON t.id = e.target "
                               "WHERE s.session_id = ? AND t.session_id = ?";
                    edge_params = json::array({*filter.session_id, *filter.session_id});
                }
                if (!filter.include_expired) {
                    where.push_back("(label <> 'ShortTermMessage' OR expires_at > ?)");
                    node_params.push_back(now);
                }
                for (size_t i = 0; i < where.size(); ++i) {
                    node_sql += (i == 0 ? " WHERE " : " AND ") + where[i];
                }
                node_sql += " ORDER BY created_at, id;";

                auto node_rows = store_.read(node_sql, node_params);
                auto edge_rows = store_.read(edge_sql, edge_params);

                for (const auto& row : node_rows) {
                    GraphNode node = node_from_row(row);
                    ids.insert(node.id);
                    view.nodes.push_back(std::move(node));
                }
                for (const auto& row : edge_rows) {
                    GraphEdge edge = edge_from_row(row);
                    // Drop edges that touch a node filtered out above.
                    if (ids.count(edge.source) && ids.count(edge.target)) {
                        view.edges.push_back(std::move(edge));
                    }
                }
                note_success();
            } catch (const std::exception& e) {
                note_failure(e.what());
                view = GraphView{};
                ids.clear();
            }
        }

        // Unflushed cache entries; the store copy wins when both exist.
        auto cached = filter.session_id
            ? cache_.session_entries(*filter.session_id, now, filter.include_expired)
            : cache_.all_entries(now, filter.include_expired);

        std::map<std::string, std::vector<ShortTermMessage>> by_session;
        for (auto& m : cached) {
            if (ids.count(m.id) == 0) by_session[m.session_id].push_back(std::move(m));
        }

        for (auto& [session, msgs] : by_session) {
            std::string sid = session_node_id(session);
            if (ids.insert(sid).second) {
                GraphNode node;
                node.id = sid;
                node.label = labels::ChatSession;
                node.properties = {{"session_id", session},
                                   {"created_at", msgs.front().created_at}};
                node.degraded = true;
                view.nodes.push_back(std::move(node));
            }

            // Chain the first cached entry onto the latest stored message before it.
            std::string prev_id;
            int64_t prev_ts = 0;
            for (const auto& n : view.nodes) {
                if (n.label != labels::ShortTermMessage) continue;
                if (n.properties.value("session_id", "") != session) continue;
                int64_t ts = n.properties.value("created_at", int64_t{0});
                if (ts < msgs.front().created_at && (prev_id.empty() || ts > prev_ts)) {
                    prev_id = n.id;
                    prev_ts = ts;
                }
            }

            for (const auto& m : msgs) {
                ids.insert(m.id);
                view.nodes.push_back(message_to_node(m));
                view.edges.push_back(GraphEdge{sid, m.id, relations::HasMessage, json::object()});
                if (!prev_id.empty()) {
                    view.edges.push_back(GraphEdge{prev_id, m.id, relations::Next, json::object()});
                }
                prev_id = m.id;
            }
        }
    }
    maybe_reconcile();
    return view;
}

// ── apply_delta ────────────────────────────────────────────────

AppliedDelta GraphMemoryService::apply_delta(const GraphDelta& delta,
                                             const std::string& target_session) {
    if (target_session.empty()) throw std::invalid_argument("target session must not be empty");

    AppliedDelta result;
    result.session_id = target_session;
    {
        std::shared_lock<std::shared_mutex> guard(reset_mutex_);
        auto st = session_state(target_session);
        std::lock_guard<std::mutex> lock(st->mutex);

        int64_t now = clock_();
        try {
            flush_session(target_session);
            load_tail(*st, target_session);
        } catch (const StorageUnavailableError& e) {
            note_failure(e.what());
            throw;
        }

        const std::string old_session_node = session_node_id(delta.session_id);
        const std::string new_session_node = session_node_id(target_session);
        auto remap = [&](const std::string& id) {
            return id == old_session_node ? new_session_node : id;
        };

        std::vector<const GraphNode*> messages;
        std::vector<const GraphNode*> others;
        for (const auto& node : delta.nodes) {
            if (node.id == old_session_node) continue;
            if (node.label == labels::ShortTermMessage) {
                messages.push_back(&node);
            } else {
                others.push_back(&node);
            }
        }
        std::stable_sort(messages.begin(), messages.end(),
            [](const GraphNode* a, const GraphNode* b) {
                return a->properties.value("created_at", int64_t{0}) <
                       b->properties.value("created_at", int64_t{0});
            });

        std::vector<Statement> stmts;
        stmts.push_back(session_statement(target_session, now));

        int64_t ts = std::max(st->last_ts, cache_.last_timestamp(target_session));
        bool first = true;
        for (const GraphNode* node : messages) {
            ts = std::max(now, ts + 1);
            json props = node->properties;
            props["simulated_at"] = node->properties.value("created_at", int64_t{0});
            props["session_id"] = target_session;
            props["created_at"] = ts;
            props["expires_at"] = ts + ttl_ms();
            stmts.push_back(node_statement(kInsertNode, node->id, labels::ShortTermMessage,
                                           target_session, ts, ts + ttl_ms(), props));
            if (first) {
                // Hook the delta's chain onto the session's existing tail.
                ShortTermMessage head;
                head.id = node->id;
                head.session_id = target_session;
                head.created_at = ts;
                stmts.push_back(link_previous_statement(head));
                first = false;
            }
            result.message_ids.push_back(node->id);
        }

        for (const GraphNode* node : others) {
            json props = node->properties;
            props["session_id"] = target_session;
            props["created_at"] = now;
            stmts.push_back(node_statement(kInsertNode, node->id, node->label,
                                           target_session, now, nullptr, props));
            if (node->label == labels::Knowledge) result.knowledge_ids.push_back(node->id);
        }

        for (const auto& edge : delta.edges) {
            stmts.push_back(edge_statement(remap(edge.source), remap(edge.target),
                                           edge.relation, edge.properties));
        }

        try {
            store_.write_batch(stmts);
            note_success();
        } catch (const StorageUnavailableError& e) {
            note_failure(e.what());
            throw;
        }
        st->last_ts = std::max(st->last_ts, ts);
        result.nodes_created = messages.size() + others.size();
        result.edges_created = delta.edges.size();
    }

    std::cerr << "[memory] Applied delta to session " << target_session << ": "
              << result.nodes_created << " nodes, " << result.edges_created << " edges\n";

    for (const auto& kid : result.knowledge_ids) {
        KnowledgeCreatedEvent ev;
        ev.session_id = target_session;
        ev.knowledge_id = kid;
        ev.source_count = result.message_ids.size();
        publish(bus_, ev);
    }

    maybe_reconcile();
    return result;
}

// ── reset / health / reconcile / purge ─────────────────────────

void GraphMemoryService::reset() {
    std::unique_lock<std::shared_mutex> guard(reset_mutex_);
    cache_.clear();
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.clear();
    }
    reconcile_pending_ = false;

    try {
        store_.write_batch({Statement{"DELETE FROM edges;", json::array()},
                            Statement{"DELETE FROM nodes;", json::array()}});
        note_success();
    } catch (const StorageUnavailableError& e) {
        note_failure(e.what());
        throw;
    }
    std::cerr << "[memory] Graph memory reset\n";
}

MemoryHealth GraphMemoryService::health() {
    bool reachable = store_.probe();
    if (reachable) {
        note_success();
        if (!cache_.empty()) reconcile_pending_ = true;
    } else {
        note_failure("probe failed");
    }
    maybe_reconcile();

    MemoryHealth h;
    h.store_reachable = reachable;
    h.state = health_state_to_string(health_.state());
    h.fallback_size = cache_.size();
    h.fallback_active = h.fallback_size > 0 || !health_.healthy();
    h.backend = store_.backend_name();
    h.last_error = health_.last_error();
    return h;
}

size_t GraphMemoryService::reconcile() {
    if (cache_.empty()) {
        reconcile_pending_ = false;
        return 0;
    }
    bool expected = false;
    if (!reconciling_.compare_exchange_strong(expected, true)) return 0;

    size_t flushed = 0;
    bool failed = false;
    {
        std::shared_lock<std::shared_mutex> guard(reset_mutex_);
        for (const auto& session : cache_.sessions()) {
            auto st = session_state(session);
            std::lock_guard<std::mutex> lock(st->mutex);
            try {
                flushed += flush_session(session);
            } catch (const std::exception& e) {
                note_failure(e.what());
                failed = true;
                break;
            }
        }
    }
    reconciling_ = false;

    if (!failed) {
        note_success();
        reconcile_pending_ = false;
        if (flushed > 0) {
            std::cerr << "[memory] Reconciled " << flushed << " cached messages\n";
        }
    }
    return flushed;
}

size_t GraphMemoryService::purge_expired() {
    std::unique_lock<std::shared_mutex> guard(reset_mutex_);
    int64_t now = clock_();
    size_t pruned = cache_.prune_expired(now);

    std::map<std::string, std::unordered_set<std::string>> doomed;
    std::vector<Statement> stmts;
    try {
        auto rows = store_.read(kSelectPurgeable, json::array({now}));
        for (const auto& row : rows) {
            doomed[row.value("session_id", "")].insert(row.value("id", ""));
        }
        if (doomed.empty()) return pruned;

        for (const auto& [session, ids] : doomed) {
            auto chain = store_.read(kSelectChain, json::array({session}));

            stmts.push_back(Statement{
                "DELETE FROM edges WHERE relation = 'NEXT' AND source IN "
                "(SELECT id FROM nodes WHERE label = 'ShortTermMessage' AND session_id = ?);",
                json::array({session})});
            for (const auto& id : ids) {
                stmts.push_back(Statement{"DELETE FROM edges WHERE source = ? OR target = ?;",
                                          json::array({id, id})});
                stmts.push_back(Statement{"DELETE FROM nodes WHERE id = ?;", json::array({id})});
            }

            // Re-link the survivors so the chain stays total.
            std::string prev;
            for (const auto& row : chain) {
                std::string id = row.value("id", "");
                if (ids.count(id)) continue;
                if (!prev.empty()) stmts.push_back(edge_statement(prev, id, relations::Next));
                prev = id;
            }
        }
        store_.write_batch(stmts);
        note_success();
    } catch (const StorageUnavailableError& e) {
        note_failure(e.what());
        std::cerr << "[memory] Purge skipped: " << e.what() << "\n";
        return pruned;
    }

    size_t deleted = 0;
    for (const auto& [session, ids] : doomed) deleted += ids.size();
    std::cerr << "[memory] Purged " << deleted << " expired messages\n";
    return pruned + deleted;
}

} // namespace graphmem
