#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/lifecycle/job_lifecycle.hpp"
#include "internal/transport/http_types.hpp"

namespace fieldsync::api {

/*
  HTTP-semantics endpoints of the field server.

    GET  /api/field/job/{id}           job with photos
    PUT  /api/field/job/{id}           status transition (JSON: action | status,
                                       skipReason, notes)
    GET  /api/field/job/{id}/photos    photo list
    POST /api/field/job/{id}/photos    multipart upload (photo, type)
    GET  /api/field/job/{id}/audit     transition history

  X-Actor-Id names the caller, Idempotency-Key makes writes safe to
  replay. Handle never throws: failures become error responses.
*/
class FieldApi {
 public:
  explicit FieldApi(std::shared_ptr<lifecycle::JobLifecycle> lifecycle);

  transport::Response Handle(const transport::Request& request);

 private:
  transport::Response Route(const transport::Request& request);

  transport::Response GetJob(const std::string& job_id);
  transport::Response TransitionJob(const std::string& job_id, const transport::Request& request,
                                    const std::string& actor);
  transport::Response ListPhotos(const std::string& job_id);
  transport::Response UploadPhoto(const std::string& job_id, const transport::Request& request,
                                  const std::string& actor);
  transport::Response ListAudit(const std::string& job_id);

  std::shared_ptr<lifecycle::JobLifecycle> lifecycle_;
};

} // namespace fieldsync::api
