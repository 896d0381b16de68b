#include <stdlib.h>
#include <glib.h>
#include <bully-kv/bully/config.h>
#include <bully-kv/common/log.h>
#include <bully-kv/common/util.h>
#include <bully-kv/server/replica.h>

static gint64 g_id = 0;
static const char* g_cluster = "127.0.0.1:12379";
static gint g_port = 63791;
static const char* g_data_dir = NULL;
static gint g_heartbeat_ms = 2000;
static gint g_election_timeout_ms = 2000;
static gint64 g_snap_count = 1000;

int main(int argc, char* argv[]) {
  GOptionEntry entries[] = {
      {"id", 'i', 0, G_OPTION_ARG_INT64, &g_id, "replica id, 1 based position in the cluster list", NULL},
      {"cluster", 'c', 0, G_OPTION_ARG_STRING, &g_cluster, "comma separated host:port of every replica", NULL},
      {"port", 'p', 0, G_OPTION_ARG_INT, &g_port, "port for redis clients", NULL},
      {"data-dir", 'd', 0, G_OPTION_ARG_STRING, &g_data_dir, "directory of the wal and snapshots, node_<id> by default", NULL},
      {"heartbeat-ms", 0, 0, G_OPTION_ARG_INT, &g_heartbeat_ms, "interval between two liveness probes", NULL},
      {"election-timeout-ms", 0, 0, G_OPTION_ARG_INT, &g_election_timeout_ms, "how long a candidate waits for higher replicas", NULL},
      {"snap-count", 0, 0, G_OPTION_ARG_INT64, &g_snap_count, "commits between two state snapshots", NULL},
      {NULL}
  };

  GError* error = NULL;
  GOptionContext* context = g_option_context_new("usage");
  g_option_context_add_main_entries(context, entries, NULL);
  if (!g_option_context_parse(context, &argc, &argv, &error)) {
    fprintf(stderr, "option parsing failed: %s\n", error->message);
    g_error_free(error);
    g_option_context_free(context);
    exit(EXIT_FAILURE);
  }
  g_option_context_free(context);

  if (g_id <= 0 || g_port <= 0 || g_port > 65535) {
    fprintf(stderr, "invalid id or port\n");
    exit(EXIT_FAILURE);
  }

  if (g_heartbeat_ms <= 0 || g_election_timeout_ms <= 0 || g_snap_count <= 0) {
    fprintf(stderr, "timeouts and snap count must be positive\n");
    exit(EXIT_FAILURE);
  }

  bully::Config config;
  config.id = static_cast<uint64_t>(g_id);
  config.peers = bully::split_cluster(g_cluster);
  config.data_dir = g_data_dir ? g_data_dir : "node_" + std::to_string(g_id);
  config.heartbeat_interval_ms = static_cast<uint32_t>(g_heartbeat_ms);
  config.heartbeat_timeout_ms = static_cast<uint32_t>(g_heartbeat_ms) / 2 + 1;
  config.election_timeout_ms = static_cast<uint32_t>(g_election_timeout_ms);
  config.coordinator_timeout_ms = 3 * config.election_timeout_ms;
  config.snap_count = static_cast<uint64_t>(g_snap_count);

  bully::Status status = config.validate();
  if (!status.is_ok()) {
    fprintf(stderr, "invalid arguments: %s\n", status.to_string().c_str());
    exit(EXIT_FAILURE);
  }

  LOG_INFO("starting replica %lu of %lu", config.id, config.cluster_size());
  bully::Replica::main(config, static_cast<uint16_t>(g_port));
  return 0;
}
