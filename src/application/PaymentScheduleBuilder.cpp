#include "application/PaymentScheduleBuilder.hpp"
#include "domain/LedgerErrors.hpp"

namespace realty::application {

using domain::InvalidScheduleError;
using domain::Money;
using domain::PaymentType;
using domain::ScheduledInstallment;

void PaymentScheduleBuilder::validate(const domain::Contract& contract) const {
    if (contract.termMonths <= 0) {
        throw InvalidScheduleError("Contract " + contract.id + ": term_months must be positive, got " +
                                   std::to_string(contract.termMonths));
    }
    if (contract.downpaymentMonths <= 0 || contract.equityMonths <= 0) {
        throw InvalidScheduleError("Contract " + contract.id + ": downpayment/equity months must be positive");
    }

    const auto& currency = contract.currency();
    for (const Money* component : {&contract.downpaymentAmount, &contract.equityAmount,
                                   &contract.loanableAmount, &contract.reservationFee}) {
        if (component->currency != currency) {
            throw InvalidScheduleError("Contract " + contract.id + ": component currency " +
                                       component->currency + " differs from " + currency);
        }
        if (component->isNegative()) {
            throw InvalidScheduleError("Contract " + contract.id + ": negative amount " + component->toString());
        }
    }
    if (!contract.totalAmount.isPositive()) {
        throw InvalidScheduleError("Contract " + contract.id + ": total amount must be positive");
    }

    Money sum = contract.downpaymentAmount + contract.equityAmount + contract.loanableAmount;
    if (sum != contract.totalAmount) {
        throw InvalidScheduleError("Contract " + contract.id + ": downpayment + equity + loanable = " +
                                   sum.toString() + " but total is " + contract.totalAmount.toString());
    }
    if (contract.reservationFee > contract.downpaymentAmount) {
        throw InvalidScheduleError("Contract " + contract.id + ": reservation fee " +
                                   contract.reservationFee.toString() + " exceeds downpayment " +
                                   contract.downpaymentAmount.toString());
    }
}

std::vector<ScheduledInstallment> PaymentScheduleBuilder::build(const domain::Contract& contract) const {
    validate(contract);

    std::vector<ScheduledInstallment> schedule;
    int monthOffset = 0;

    if (contract.reservationFee.isPositive()) {
        ScheduledInstallment reservation;
        reservation.contractId = contract.id;
        reservation.installmentNumber = 1;
        reservation.amount = contract.reservationFee;
        reservation.dueDate = contract.startDate;
        reservation.paymentType = PaymentType::RESERVATION_FEE;
        reservation.paidAmount = Money::zero(contract.currency());
        reservation.penaltyAmount = Money::zero(contract.currency());
        reservation.penaltyPaid = Money::zero(contract.currency());
        schedule.push_back(reservation);
    }

    appendGroup(schedule, contract, PaymentType::DOWNPAYMENT,
                contract.downpaymentAmount - contract.reservationFee,
                contract.downpaymentMonths, monthOffset);
    appendGroup(schedule, contract, PaymentType::EQUITY,
                contract.equityAmount, contract.equityMonths, monthOffset);
    appendGroup(schedule, contract, PaymentType::MONTHLY_AMORTIZATION,
                contract.loanableAmount, contract.termMonths, monthOffset);

    if (schedule.empty()) {
        throw InvalidScheduleError("Contract " + contract.id + ": schedule has no installments");
    }
    return schedule;
}

void PaymentScheduleBuilder::appendGroup(
    std::vector<ScheduledInstallment>& schedule,
    const domain::Contract& contract,
    PaymentType type,
    const Money& groupTotal,
    int parts,
    int& monthOffset
) const {
    if (groupTotal.isZero()) {
        return;
    }

    Money perInstallment = groupTotal.divideRounded(parts);
    Money allocated = Money::zero(groupTotal.currency);

    for (int i = 0; i < parts; ++i) {
        ++monthOffset;

        ScheduledInstallment installment;
        installment.contractId = contract.id;
        installment.installmentNumber = static_cast<int>(schedule.size()) + 1;
        installment.amount = (i == parts - 1) ? groupTotal - allocated : perInstallment;
        installment.dueDate = contract.startDate.addMonths(monthOffset);
        installment.paymentType = type;
        installment.paidAmount = Money::zero(groupTotal.currency);
        installment.penaltyAmount = Money::zero(groupTotal.currency);
        installment.penaltyPaid = Money::zero(groupTotal.currency);

        if (installment.amount.isNegative()) {
            // Округление вверх на большом числе частей может перебрать сумму группы
            throw InvalidScheduleError("Contract " + contract.id + ": " + std::to_string(parts) + " " +
                                       domain::toString(type) + " installments cannot split " +
                                       groupTotal.toString());
        }

        allocated += installment.amount;
        schedule.push_back(installment);
    }
}

} // namespace realty::application
