#include "application/ContractLifecycle.hpp"
#include "domain/ContractProgress.hpp"
#include "domain/LedgerErrors.hpp"

namespace realty::application {

using domain::Contract;
using domain::ContractStatus;
using domain::SignatureParty;
using domain::Timestamp;

bool ContractLifecycle::canTransition(ContractStatus from, ContractStatus to) {
    switch (from) {
        case ContractStatus::DRAFT:
            return to == ContractStatus::PENDING_SIGNATURE ||
                   to == ContractStatus::TERMINATED ||
                   to == ContractStatus::CANCELLED;
        case ContractStatus::PENDING_SIGNATURE:
            return to == ContractStatus::ACTIVE ||
                   to == ContractStatus::TERMINATED ||
                   to == ContractStatus::CANCELLED;
        case ContractStatus::ACTIVE:
            return to == ContractStatus::COMPLETED ||
                   to == ContractStatus::EXPIRED ||
                   to == ContractStatus::TERMINATED ||
                   to == ContractStatus::CANCELLED;
        case ContractStatus::COMPLETED:
        case ContractStatus::TERMINATED:
        case ContractStatus::CANCELLED:
        case ContractStatus::EXPIRED:
            return false;
    }
    return false;
}

void ContractLifecycle::transition(Contract& contract, ContractStatus to, const Timestamp& at) const {
    if (!canTransition(contract.status, to)) {
        throw domain::InvalidTransitionError("Contract " + contract.id + " cannot move from " +
                                             domain::toString(contract.status) + " to " + domain::toString(to));
    }
    contract.status = to;
    contract.updatedAt = at;
}

void ContractLifecycle::submitForSignature(Contract& contract, const Timestamp& at) const {
    if (!contract.hasSchedule()) {
        throw domain::InvalidTransitionError("Contract " + contract.id + " has no payment schedule");
    }
    transition(contract, ContractStatus::PENDING_SIGNATURE, at);
}

bool ContractLifecycle::recordSignature(
    Contract& contract,
    SignatureParty party,
    const std::string& blob,
    const Timestamp& at
) const {
    if (contract.status != ContractStatus::DRAFT && contract.status != ContractStatus::PENDING_SIGNATURE) {
        throw domain::InvalidTransitionError("Contract " + contract.id + " cannot be signed in status " +
                                             domain::toString(contract.status));
    }

    domain::Signature* signature = nullptr;
    switch (party) {
        case SignatureParty::CLIENT:
            signature = &contract.signatures.client;
            break;
        case SignatureParty::LANDLORD:
            signature = &contract.signatures.landlord;
            break;
        case SignatureParty::AGENT:
            if (!contract.agentId) {
                throw domain::InvalidTransitionError("Contract " + contract.id + " has no agent to sign");
            }
            signature = &contract.signatures.agent;
            break;
    }

    signature->isSigned = true;
    signature->signedAt = at;
    signature->blob = blob;
    contract.updatedAt = at;

    if (contract.status == ContractStatus::PENDING_SIGNATURE && domain::progress::isFullySigned(contract)) {
        transition(contract, ContractStatus::ACTIVE, at);
        return true;
    }
    return false;
}

void ContractLifecycle::activate(Contract& contract, const Timestamp& at) const {
    if (!domain::progress::isFullySigned(contract)) {
        throw domain::InvalidTransitionError("Contract " + contract.id + " is not signed by all required parties");
    }
    transition(contract, ContractStatus::ACTIVE, at);
}

bool ContractLifecycle::completeIfPaid(Contract& contract, const Timestamp& at) const {
    if (contract.status != ContractStatus::ACTIVE || !domain::progress::isFullyPaid(contract)) {
        return false;
    }
    transition(contract, ContractStatus::COMPLETED, at);
    return true;
}

bool ContractLifecycle::expireIfDue(Contract& contract, const Timestamp& now) const {
    if (contract.status != ContractStatus::ACTIVE || !contract.endDate || !(now > *contract.endDate)) {
        return false;
    }
    transition(contract, ContractStatus::EXPIRED, now);
    return true;
}

void ContractLifecycle::terminate(Contract& contract, const std::string& reason, const Timestamp& at) const {
    transition(contract, ContractStatus::TERMINATED, at);
    contract.cancellationReason = reason;
}

void ContractLifecycle::cancel(Contract& contract, const std::string& reason, const Timestamp& at) const {
    transition(contract, ContractStatus::CANCELLED, at);
    contract.cancellationReason = reason;
}

} // namespace realty::application
