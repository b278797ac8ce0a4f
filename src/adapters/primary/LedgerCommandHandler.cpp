#include "adapters/primary/LedgerCommandHandler.hpp"
#include "domain/DomainJson.hpp"
#include "domain/LedgerErrors.hpp"
#include <iostream>
#include <stdexcept>

namespace realty::adapters::primary {

using nlohmann::json;

namespace {

std::string requireString(const json& request, const char* field) {
    if (!request.contains(field) || !request.at(field).is_string() || request.at(field).get<std::string>().empty()) {
        throw std::invalid_argument(std::string("Missing required field: ") + field);
    }
    return request.at(field).get<std::string>();
}

std::optional<std::string> optionalString(const json& request, const char* field) {
    if (!request.contains(field) || request.at(field).is_null()) {
        return std::nullopt;
    }
    return request.at(field).get<std::string>();
}

domain::Money requireMoney(const json& request, const char* field) {
    if (!request.contains(field)) {
        throw std::invalid_argument(std::string("Missing required field: ") + field);
    }
    return request.at(field).get<domain::Money>();
}

domain::Money moneyOrZero(const json& request, const char* field, const std::string& currency) {
    if (!request.contains(field)) {
        return domain::Money::zero(currency);
    }
    domain::Money money = domain::Money::zero(currency);
    from_json(request.at(field), money);
    return money;
}

int intOrDefault(const json& request, const char* field, int defaultValue) {
    if (!request.contains(field)) {
        return defaultValue;
    }
    if (!request.at(field).is_number_integer()) {
        throw std::invalid_argument(std::string(field) + " must be an integer");
    }
    return request.at(field).get<int>();
}

domain::Property parseProperty(const json& body) {
    domain::Property property;
    property.id = requireString(body, "id");
    property.price = requireMoney(body, "price");
    if (body.contains("constructionTriggerPercentage")) {
        property.constructionTriggerPercentage = body.at("constructionTriggerPercentage").get<domain::Percent>();
    }
    if (body.contains("turnoverReadinessPercentage")) {
        property.turnoverReadinessPercentage = body.at("turnoverReadinessPercentage").get<domain::Percent>();
    }
    return property;
}

domain::Contract parseContract(const json& body) {
    domain::Contract contract;
    if (auto id = optionalString(body, "id")) {
        contract.id = *id;
    }
    contract.contractNumber = body.value("contractNumber", "");
    if (body.contains("type")) {
        contract.type = domain::contractTypeFromString(body.at("type").get<std::string>());
    }
    contract.propertyId = requireString(body, "propertyId");
    contract.clientId = requireString(body, "clientId");
    contract.developerId = requireString(body, "developerId");
    contract.agentId = optionalString(body, "agentId");
    contract.brokerId = optionalString(body, "brokerId");

    contract.totalAmount = requireMoney(body, "totalAmount");
    const auto& currency = contract.totalAmount.currency;
    contract.reservationFee = moneyOrZero(body, "reservationFee", currency);
    contract.downpaymentAmount = moneyOrZero(body, "downpaymentAmount", currency);
    contract.equityAmount = moneyOrZero(body, "equityAmount", currency);
    contract.loanableAmount = moneyOrZero(body, "loanableAmount", currency);

    contract.downpaymentMonths = intOrDefault(body, "downpaymentMonths", 1);
    contract.equityMonths = intOrDefault(body, "equityMonths", 1);
    contract.termMonths = intOrDefault(body, "termMonths", 0);
    contract.allowPrepayment = body.value("allowPrepayment", false);

    contract.startDate = domain::Timestamp::fromString(requireString(body, "startDate"));
    if (auto endDate = optionalString(body, "endDate")) {
        contract.endDate = domain::Timestamp::fromString(*endDate);
    }
    if (body.contains("commissionRateAgent")) {
        contract.commissionRateAgent = body.at("commissionRateAgent").get<domain::Percent>();
    }
    if (body.contains("commissionRateBroker")) {
        contract.commissionRateBroker = body.at("commissionRateBroker").get<domain::Percent>();
    }
    return contract;
}

json constructionStatusToJson(const application::ConstructionStatus& status) {
    return json{
        {"principalPaid", status.principalPaid},
        {"constructionThreshold", status.constructionThreshold},
        {"turnoverThreshold", status.turnoverThreshold},
        {"canStartConstruction", status.canStartConstruction},
        {"isTurnoverReady", status.isTurnoverReady},
        {"progressBasisPoints", status.progressBasisPoints}
    };
}

} // namespace

LedgerCommandHandler::LedgerCommandHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
    : ledgerService_(std::move(ledgerService))
{
    registerCommands();
    std::cout << "[LedgerCommandHandler] Created, " << commands_.size() << " commands" << std::endl;
}

std::string LedgerCommandHandler::handle(const std::string& request) {
    json parsed;
    try {
        parsed = json::parse(request);
    } catch (const json::parse_error& e) {
        std::cerr << "[LedgerCommandHandler] Invalid JSON: " << e.what() << std::endl;
        return errorResponse("InvalidRequest", std::string("Invalid JSON: ") + e.what()).dump();
    }
    return execute(parsed).dump();
}

json LedgerCommandHandler::execute(const json& request) {
    if (!request.is_object() || !request.contains("command") || !request.at("command").is_string()) {
        return errorResponse("InvalidRequest", "Missing required field: command");
    }

    std::string name = request.at("command").get<std::string>();
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cerr << "[LedgerCommandHandler] Unknown command: " << name << std::endl;
        return errorResponse("InvalidRequest", "Unknown command: " + name);
    }

    try {
        json response;
        response["status"] = "ok";
        response["result"] = it->second(request);
        return response;
    } catch (const domain::LedgerError& e) {
        std::cerr << "[LedgerCommandHandler] " << name << " rejected: " << e.name() << ": " << e.what() << std::endl;
        return errorResponse(e.name(), e.what());
    } catch (const json::exception& e) {
        std::cerr << "[LedgerCommandHandler] " << name << " invalid request: " << e.what() << std::endl;
        return errorResponse("InvalidRequest", e.what());
    } catch (const std::invalid_argument& e) {
        std::cerr << "[LedgerCommandHandler] " << name << " invalid request: " << e.what() << std::endl;
        return errorResponse("InvalidRequest", e.what());
    } catch (const std::overflow_error& e) {
        std::cerr << "[LedgerCommandHandler] " << name << " value out of range: " << e.what() << std::endl;
        return errorResponse("InvalidRequest", e.what());
    }
}

json LedgerCommandHandler::errorResponse(const std::string& error, const std::string& message) {
    return json{{"status", "error"}, {"error", error}, {"message", message}};
}

void LedgerCommandHandler::registerCommands() {
    auto& service = ledgerService_;

    // ===== Договор =====

    commands_["registerProperty"] = [service](const json& request) {
        domain::Property property = parseProperty(request.at("property"));
        service->registerProperty(property);
        return json(property);
    };

    commands_["registerContract"] = [service](const json& request) {
        return json(service->registerContract(parseContract(request.at("contract"))));
    };

    commands_["prepareSchedule"] = [service](const json& request) {
        return json(service->prepareSchedule(requireString(request, "contractId")));
    };

    commands_["sign"] = [service](const json& request) {
        auto party = domain::signaturePartyFromString(requireString(request, "party"));
        return json(service->recordSignature(requireString(request, "contractId"), party,
                                             request.value("blob", "")));
    };

    commands_["activate"] = [service](const json& request) {
        return json(service->activate(requireString(request, "contractId")));
    };

    commands_["terminate"] = [service](const json& request) {
        return json(service->terminate(requireString(request, "contractId"), request.value("reason", "")));
    };

    commands_["cancel"] = [service](const json& request) {
        return json(service->cancel(requireString(request, "contractId"), request.value("reason", "")));
    };

    commands_["expireContracts"] = [service](const json&) {
        return json(service->expireContracts());
    };

    // ===== Деньги =====

    commands_["applyPayment"] = [service](const json& request) {
        domain::PaymentRecord record;
        record.contractId = requireString(request, "contractId");
        record.amount = requireMoney(request, "amount");
        if (auto receivedAt = optionalString(request, "receivedAt")) {
            record.receivedAt = domain::Timestamp::fromString(*receivedAt);
        }
        record.externalReference = request.value("externalReference", "");
        return json(service->applyPayment(record));
    };

    commands_["reverse"] = [service](const json& request) {
        return json(service->reverseTransaction(requireString(request, "transactionId"),
                                                request.value("reason", "")));
    };

    commands_["refund"] = [service](const json& request) {
        return json(service->refund(requireString(request, "contractId"), requireMoney(request, "amount"),
                                    request.value("reason", "")));
    };

    commands_["payoutCommission"] = [service](const json& request) {
        return json(service->payoutCommission(requireString(request, "commissionRecordId")));
    };

    commands_["assessPenalties"] = [service](const json& request) {
        return json(service->assessPenalties(requireString(request, "contractId")));
    };

    // ===== Чтение =====

    commands_["getContract"] = [service](const json& request) {
        std::string contractId = requireString(request, "contractId");
        auto contract = service->getContract(contractId);
        if (!contract) {
            throw domain::NotFoundError("Contract not found: " + contractId);
        }
        return json(*contract);
    };

    commands_["getTransactions"] = [service](const json& request) {
        return json(service->getTransactions(requireString(request, "contractId")));
    };

    commands_["getCommissions"] = [service](const json& request) {
        return json(service->getCommissions(requireString(request, "contractId")));
    };

    commands_["getProgress"] = [service](const json& request) {
        return json(service->getPaymentProgress(requireString(request, "contractId")));
    };

    commands_["getConstructionStatus"] = [service](const json& request) {
        return constructionStatusToJson(service->getConstructionStatus(requireString(request, "contractId")));
    };
}

} // namespace realty::adapters::primary
