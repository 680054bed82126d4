#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/providers/render_provider.hpp"
#include "internal/providers/transcription_provider.hpp"
#include "internal/service/editing_service.hpp"
#include "internal/service/service_context.hpp"

namespace longform::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext                          context;
  std::shared_ptr<service::EditingService>         editing_service;
  std::vector<std::unique_ptr<::grpc::Service>>    grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and collaborator types.
*/
Application Build(const longform::runtime::config::RuntimeConfig& config);

// Wires the pipeline over already constructed storage and collaborators.
service::ServiceContext BuildServiceContext(const longform::runtime::config::RuntimeConfig&   config,
                                            std::shared_ptr<db::Repository>                   repository,
                                            std::shared_ptr<providers::TranscriptionProvider> transcription,
                                            std::shared_ptr<providers::RenderProvider>        render);

std::shared_ptr<db::Repository> BuildRepository(const longform::runtime::config::RuntimeConfig& config);

} // namespace longform::factory
