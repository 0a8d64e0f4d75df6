#ifndef KERNEL_SNAPSHOT_H
#define KERNEL_SNAPSHOT_H

#include "kernel/Config.h"
#include "kernel/ParameterGrid.h"
#include <iosfwd>
#include <string>

class Kernel;

// Configuration as indented JSON, in the Graph/OD/Ranker/Simulation_details layout
std::string configToJson(const SimulationConfig& cfg);

// Reads that layout back. Missing fields keep their defaults; malformed JSON,
// wrongly typed fields, unknown names and invalid values throw
// std::invalid_argument. loadConfig throws std::runtime_error if the file
// cannot be opened.
SimulationConfig configFromJson(const std::string& text);
SimulationConfig loadConfig(const std::string& path);

// Sweep description: {"grid": {"OD.epsilon": [...], "Ranker.rule": [...],
// "Ranker.alpha": [...], "Ranker.target_opinion": [...]}}. Other top-level
// keys are ignored.
ParameterGrid parameterGridFromJson(const std::string& text);
ParameterGrid loadParameterGrid(const std::string& path);

// JSON export for kernel state (optionally with the whole post buffer)
std::string kernelToJson(const Kernel& kernel, bool includePosts = false);

// CSV metrics logging
void logMetricsHeader(std::ostream& out);
void logMetrics(const Kernel& kernel, std::ostream& out);

#endif
