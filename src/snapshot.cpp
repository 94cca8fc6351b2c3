#include <pitwall/snapshot.hpp>
#include <iomanip>
#include <sstream>

namespace pitwall {

std::uint64_t wall_clock_ms() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
    duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

namespace {

void emit_counters(std::ostream& js, const MetricsSnapshot& m) {
  js << "{"
     << "\"received\":" << m.received
     << ",\"bytes_received\":" << m.bytes_received
     << ",\"malformed\":" << m.malformed
     << ",\"version_mismatch\":" << m.version_mismatch
     << ",\"checksum_failures\":" << m.checksum_failures
     << ",\"filtered\":" << m.filtered
     << ",\"duplicates\":" << m.duplicates
     << ",\"out_of_order\":" << m.out_of_order
     << ",\"admitted\":" << m.admitted
     << ",\"evicted\":" << m.evicted
     << ",\"rejected\":" << m.rejected
     << ",\"processed\":" << m.processed
     << ",\"late\":" << m.late
     << ",\"processing_errors\":" << m.processing_errors
     << ",\"dropped\":" << m.dropped()
     << "}";
}

void emit_latest(std::ostream& js, const Sample& s) {
  const Channels& c = s.ch;
  js << "{"
     << "\"car\":" << s.car
     << ",\"seq\":" << s.seq
     << ",\"source_ts\":" << s.source_ts_ms
     << ",\"priority\":\"" << priority_name(s.priority) << "\""
     << ",\"speed\":" << c.speed_kmh
     << ",\"throttle\":" << c.throttle
     << ",\"brake\":" << c.brake
     << ",\"gear\":" << static_cast<int>(c.gear)
     << ",\"rpm\":" << c.rpm
     << ",\"drs\":" << (c.drs ? "true" : "false")
     << ",\"water_temp\":" << c.water_temp_c
     << ",\"oil_pressure\":" << c.oil_pressure_bar
     << ",\"fuel_flow\":" << c.fuel_flow_kg_h
     << ",\"tyre_temps\":[";
  for (std::size_t i = 0; i < c.tyre_temp_c.size(); ++i) {
    js << (i ? "," : "") << c.tyre_temp_c[i];
  }
  js << "],\"position\":[";
  for (std::size_t i = 0; i < c.position_m.size(); ++i) {
    js << (i ? "," : "") << c.position_m[i];
  }
  js << "]}";
}

} // namespace

std::string to_json(const PipelineSnapshot& s) {
  const MetricsSnapshot& m = s.metrics;
  std::ostringstream js;
  js << std::fixed << std::setprecision(3);

  js << "{"
     << "\"timestamp\":" << s.wall_ts_ms
     << ",\"throughput\":" << m.throughput_sps
     << ",\"bytes_per_sec\":" << m.bytes_per_sec
     << ",\"latency_p50\":" << m.latency.p50_ms
     << ",\"latency_p99\":" << m.latency.p99_ms
     << ",\"latency_mean\":" << m.latency.mean_ms
     << ",\"latency_max\":" << m.latency.max_ms
     << ",\"budget_ms\":" << s.budget.count()
     << ",\"drop_rate\":" << m.drop_rate_pct
     << ",\"uptime\":" << m.uptime_s
     << ",\"counters\":";
  emit_counters(js, m);

  js << ",\"buffer\":{"
     << "\"size\":" << s.buffer_size
     << ",\"capacity\":" << s.buffer_capacity
     << ",\"high_water\":" << s.buffer_high_water
     << "}";

  js << ",\"recent_outcomes\":[";
  for (std::size_t i = 0; i < s.recent_outcomes.size(); ++i) {
    const auto& o = s.recent_outcomes[i];
    js << (i ? "," : "")
       << "{\"car\":" << o.car
       << ",\"seq\":" << o.seq
       << ",\"priority\":\"" << priority_name(o.priority) << "\""
       << ",\"status\":\"" << to_string(o.status) << "\""
       << ",\"latency_ms\":" << static_cast<double>(o.latency.count()) / 1000.0
       << ",\"met_deadline\":" << (o.met_deadline ? "true" : "false")
       << "}";
  }
  js << "]";

  js << ",\"recent_decisions\":[";
  for (std::size_t i = 0; i < s.recent_decisions.size(); ++i) {
    const auto& d = s.recent_decisions[i];
    js << (i ? "," : "")
       << "{\"id\":" << d.id
       << ",\"car\":" << d.car
       << ",\"seq\":" << d.seq
       << ",\"source_ts\":" << d.source_ts_ms
       << ",\"advisory\":\"" << advisory_name(d.advisory) << "\""
       << ",\"value\":" << d.value
       << "}";
  }
  js << "]";
  js << ",\"total_decisions\":" << s.total_decisions;
  js << ",\"untracked_readings\":" << s.untracked_readings;

  js << ",\"latest\":";
  if (s.has_latest) emit_latest(js, s.latest);
  else js << "null";

  js << "}";
  return js.str();
}

} // namespace pitwall
