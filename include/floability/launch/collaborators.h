/***
 * Name: floability::launch (collaborators)
 * Purpose: Opaque helpers consumed before staging: building an environment archive
 *   from a description, and fetching a backpack's input data.
 * Inputs: Description / data spec paths and the run context
 * Outputs: Archive path (materializer); data on disk (fetcher)
 * Theory of Operation: Interfaces with command-backed defaults. A non-zero exit from
 *   the helper becomes EnvironmentBuildError or DataFetchError carrying its output.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

namespace floability {
namespace launch {

class EnvironmentMaterializer {
 public:
  virtual ~EnvironmentMaterializer() = default;
  /*** Materialize: Build an archive for description; returns its path. */
  virtual std::string Materialize(const std::string& description, const std::string& manager_identity,
                                  const std::string& run_dir) = 0;
};

class DataFetcher {
 public:
  virtual ~DataFetcher() = default;
  /*** Fetch: Make the data described by spec_path available under root_path. Idempotent. */
  virtual void Fetch(const std::string& spec_path, const std::string& root_path) = 0;
};

/*** CommandMaterializer: "<program> <description> <run_dir>/environment.tar.gz". */
class CommandMaterializer final : public EnvironmentMaterializer {
 public:
  explicit CommandMaterializer(std::string program = "poncho_package_create") : program_(std::move(program)) {}
  std::string Materialize(const std::string& description, const std::string& manager_identity,
                          const std::string& run_dir) override;

 private:
  std::string program_;
};

/*** CommandDataFetcher: "<program> --data-spec <spec> --backpack-root <root>". */
class CommandDataFetcher final : public DataFetcher {
 public:
  explicit CommandDataFetcher(std::string program = "floability-data-fetch") : program_(std::move(program)) {}
  void Fetch(const std::string& spec_path, const std::string& root_path) override;

 private:
  std::string program_;
};

}  // namespace launch
}  // namespace floability
