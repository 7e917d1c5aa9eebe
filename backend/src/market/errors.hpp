#pragma once

#include <string>
#include <utility>
#include <variant>

enum class MarketErrorKind {
    Validation,
    Authorization,
    State,
    InsufficientPayment,
    TransferFailure,
};

enum class MarketErrorCode {
    // Validation: listing configuration
    InvalidListingType,
    MissingSeller,
    MissingTokenContract,
    InvalidTotalAvailable,
    InvalidTotalPerSale,
    InvalidTokenSpec,
    InvalidTimes,
    InvalidBps,
    LazyNotAllowed,
    LazyRequired,
    NonZeroInitialAmount,
    ExtensionNotAllowed,
    MinIncrementNotAllowed,
    DeliveryFeeNotAllowed,
    OffersNotAllowed,
    StartNotInFuture,
    InvalidReceivers,
    // Validation: operation arguments
    InvalidCount,
    InvalidArguments,
    ExceedsMaxAmount,

    // Authorization
    SellerNotAuthorized,
    BuyerNotVerified,
    NotSeller,
    NotAdmin,
    NotPermitted,

    // State
    MarketplaceDisabled,
    ListingNotFound,
    ListingFinalized,
    ListingNotStarted,
    ListingEnded,
    ListingNotEnded,
    WrongListingType,
    HasActivity,
    SoldOut,
    BidExists,
    NoBid,
    AlreadySettled,
    OfferNotFound,
    OfferAccepted,
    OfferChanged,
    OffersDisabled,
    RescindTooEarly,
    RoyaltyAlreadySet,
    CollaboratorMissing,
    CollaboratorFailed,
    Reentrant,

    // InsufficientPayment
    InvalidPaymentAmount,
    BidTooLow,
    InsufficientBalance,

    // TransferFailure
    PaymentCollectFailed,
    PaymentFailed,
    AssetTransferFailed,
};

inline MarketErrorKind kind_of(MarketErrorCode code) {
    switch (code) {
        case MarketErrorCode::SellerNotAuthorized:
        case MarketErrorCode::BuyerNotVerified:
        case MarketErrorCode::NotSeller:
        case MarketErrorCode::NotAdmin:
        case MarketErrorCode::NotPermitted:
            return MarketErrorKind::Authorization;

        case MarketErrorCode::MarketplaceDisabled:
        case MarketErrorCode::ListingNotFound:
        case MarketErrorCode::ListingFinalized:
        case MarketErrorCode::ListingNotStarted:
        case MarketErrorCode::ListingEnded:
        case MarketErrorCode::ListingNotEnded:
        case MarketErrorCode::WrongListingType:
        case MarketErrorCode::HasActivity:
        case MarketErrorCode::SoldOut:
        case MarketErrorCode::BidExists:
        case MarketErrorCode::NoBid:
        case MarketErrorCode::AlreadySettled:
        case MarketErrorCode::OfferNotFound:
        case MarketErrorCode::OfferAccepted:
        case MarketErrorCode::OfferChanged:
        case MarketErrorCode::OffersDisabled:
        case MarketErrorCode::RescindTooEarly:
        case MarketErrorCode::RoyaltyAlreadySet:
        case MarketErrorCode::CollaboratorMissing:
        case MarketErrorCode::CollaboratorFailed:
        case MarketErrorCode::Reentrant:
            return MarketErrorKind::State;

        case MarketErrorCode::InvalidPaymentAmount:
        case MarketErrorCode::BidTooLow:
        case MarketErrorCode::InsufficientBalance:
            return MarketErrorKind::InsufficientPayment;

        case MarketErrorCode::PaymentCollectFailed:
        case MarketErrorCode::PaymentFailed:
        case MarketErrorCode::AssetTransferFailed:
            return MarketErrorKind::TransferFailure;

        default:
            return MarketErrorKind::Validation;
    }
}

inline const char* to_cstr(MarketErrorKind k) {
    switch (k) {
        case MarketErrorKind::Validation: return "ValidationError";
        case MarketErrorKind::Authorization: return "AuthorizationError";
        case MarketErrorKind::State: return "StateError";
        case MarketErrorKind::InsufficientPayment: return "InsufficientPaymentError";
        case MarketErrorKind::TransferFailure: return "TransferFailure";
    }
    return "?";
}

struct MarketError {
    MarketErrorCode code;
    std::string message;

    MarketErrorKind kind() const { return kind_of(code); }
};

template <typename T>
using Outcome = std::variant<T, MarketError>;

inline MarketError market_error(MarketErrorCode code, std::string message) {
    return MarketError{code, std::move(message)};
}

template <typename T>
bool is_error(const Outcome<T>& o) { return std::holds_alternative<MarketError>(o); }

template <typename T>
const MarketError& error_of(const Outcome<T>& o) { return std::get<MarketError>(o); }
