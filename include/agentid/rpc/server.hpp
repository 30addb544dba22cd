#pragma once

#include <agentid/execution/engine.hpp>
#include <agentid/v1/agentid.grpc.pb.h>

namespace agentid::rpc {

/// Callback-style gRPC listener for agentid.v1.CredentialService.
///
/// Every handler completes inline on the calling gRPC thread and always
/// finishes with Status::OK; operation failures travel in the response's
/// OperationStatus (or the verification envelope) so clients see the same
/// error codes the engine reports. Malformed JSON fields are reported as
/// invalid_request.
///
/// Quick reference:
/// - Health: liveness and whether this process can sign.
/// - RegisterIssuer / IssueCredential / RenewCredential / RevokeCredential /
///   SuspendCredential / ReinstateCredential / BulkCredentials: issuer side.
/// - VerifyCredential / VerifyBatch / CheckAuthorization / GetRevocations:
///   relying-party side, no issuer identity required.
/// - UpsertPolicy / UpdatePolicy / AssignPolicy / RemovePolicy /
///   DeletePolicy: live permission policies.
/// - Sweep: materialise expiry of credentials and grants.
struct listener final : public agentid::v1::CredentialService::CallbackService {
  explicit listener(agentid::execution::engine& engine);

  grpc::ServerUnaryReactor* Health(
      grpc::CallbackServerContext* context,
      const agentid::v1::HealthRequest* request,
      agentid::v1::HealthResponse* response) override final;

  grpc::ServerUnaryReactor* RegisterIssuer(
      grpc::CallbackServerContext* context,
      const agentid::v1::RegisterIssuerRequest* request,
      agentid::v1::RegisterIssuerResponse* response) override final;

  grpc::ServerUnaryReactor* IssueCredential(
      grpc::CallbackServerContext* context,
      const agentid::v1::IssueCredentialRequest* request,
      agentid::v1::CredentialResponse* response) override final;

  grpc::ServerUnaryReactor* VerifyCredential(
      grpc::CallbackServerContext* context,
      const agentid::v1::VerifyCredentialRequest* request,
      agentid::v1::VerifyCredentialResponse* response) override final;

  grpc::ServerUnaryReactor* VerifyBatch(
      grpc::CallbackServerContext* context,
      const agentid::v1::VerifyBatchRequest* request,
      agentid::v1::VerifyBatchResponse* response) override final;

  grpc::ServerUnaryReactor* RenewCredential(
      grpc::CallbackServerContext* context,
      const agentid::v1::RenewCredentialRequest* request,
      agentid::v1::CredentialResponse* response) override final;

  grpc::ServerUnaryReactor* RevokeCredential(
      grpc::CallbackServerContext* context,
      const agentid::v1::RevokeCredentialRequest* request,
      agentid::v1::RevokeCredentialResponse* response) override final;

  grpc::ServerUnaryReactor* SuspendCredential(
      grpc::CallbackServerContext* context,
      const agentid::v1::CredentialStateRequest* request,
      agentid::v1::CredentialResponse* response) override final;

  grpc::ServerUnaryReactor* ReinstateCredential(
      grpc::CallbackServerContext* context,
      const agentid::v1::CredentialStateRequest* request,
      agentid::v1::CredentialResponse* response) override final;

  grpc::ServerUnaryReactor* BulkCredentials(
      grpc::CallbackServerContext* context,
      const agentid::v1::BulkCredentialsRequest* request,
      agentid::v1::BulkCredentialsResponse* response) override final;

  grpc::ServerUnaryReactor* UpsertPolicy(
      grpc::CallbackServerContext* context,
      const agentid::v1::UpsertPolicyRequest* request,
      agentid::v1::UpsertPolicyResponse* response) override final;

  grpc::ServerUnaryReactor* UpdatePolicy(
      grpc::CallbackServerContext* context,
      const agentid::v1::UpdatePolicyRequest* request,
      agentid::v1::UpdatePolicyResponse* response) override final;

  grpc::ServerUnaryReactor* AssignPolicy(
      grpc::CallbackServerContext* context,
      const agentid::v1::AssignPolicyRequest* request,
      agentid::v1::AffectedCredentialsResponse* response) override final;

  grpc::ServerUnaryReactor* RemovePolicy(
      grpc::CallbackServerContext* context,
      const agentid::v1::RemovePolicyRequest* request,
      agentid::v1::AffectedCredentialsResponse* response) override final;

  grpc::ServerUnaryReactor* DeletePolicy(
      grpc::CallbackServerContext* context,
      const agentid::v1::DeletePolicyRequest* request,
      agentid::v1::AffectedCredentialsResponse* response) override final;

  grpc::ServerUnaryReactor* RequestAuthorization(
      grpc::CallbackServerContext* context,
      const agentid::v1::RequestAuthorizationRequest* request,
      agentid::v1::AuthorizationResponse* response) override final;

  grpc::ServerUnaryReactor* RespondAuthorization(
      grpc::CallbackServerContext* context,
      const agentid::v1::RespondAuthorizationRequest* request,
      agentid::v1::AuthorizationResponse* response) override final;

  grpc::ServerUnaryReactor* CheckAuthorization(
      grpc::CallbackServerContext* context,
      const agentid::v1::CheckAuthorizationRequest* request,
      agentid::v1::CheckAuthorizationResponse* response) override final;

  grpc::ServerUnaryReactor* GetReputation(
      grpc::CallbackServerContext* context,
      const agentid::v1::GetReputationRequest* request,
      agentid::v1::GetReputationResponse* response) override final;

  grpc::ServerUnaryReactor* GetReputationHistory(
      grpc::CallbackServerContext* context,
      const agentid::v1::GetReputationHistoryRequest* request,
      agentid::v1::GetReputationHistoryResponse* response) override final;

  grpc::ServerUnaryReactor* GetLeaderboard(
      grpc::CallbackServerContext* context,
      const agentid::v1::GetLeaderboardRequest* request,
      agentid::v1::GetLeaderboardResponse* response) override final;

  grpc::ServerUnaryReactor* GetRevocations(
      grpc::CallbackServerContext* context,
      const agentid::v1::GetRevocationsRequest* request,
      agentid::v1::GetRevocationsResponse* response) override final;

  grpc::ServerUnaryReactor* CreateWebhook(
      grpc::CallbackServerContext* context,
      const agentid::v1::CreateWebhookRequest* request,
      agentid::v1::CreateWebhookResponse* response) override final;

  grpc::ServerUnaryReactor* Sweep(
      grpc::CallbackServerContext* context,
      const agentid::v1::SweepRequest* request,
      agentid::v1::SweepResponse* response) override final;

  agentid::execution::engine& engine_;
};

}  // namespace agentid::rpc
