#include "citation/citation_catalog.hpp"

#include <algorithm>

namespace privguard {

CitationCatalog::CitationCatalog() {
    using R = Regulation;

    entries_ = {
        // GDPR
        {R::GDPR, "", "GDPR Art. 32(1)(a)",
         "Security of processing: appropriate technical measures include the "
         "pseudonymisation and encryption of personal data."},
        {R::GDPR, std::string(kind::kPersonName), "GDPR Art. 4(5)",
         "Names are direct identifiers; pseudonymisation replaces them with "
         "identifiers such as 'Subject-001' that need separate information to re-link."},
        {R::GDPR, std::string(kind::kEmail), "GDPR Art. 32(1)(a)",
         "Email addresses identify a person directly; the domain may be kept "
         "for analysis while the local part is protected."},
        {R::GDPR, std::string(kind::kPhone), "GDPR Art. 32(1)(a)",
         "Phone numbers are direct identifiers; masking keeps the trailing "
         "digits for statistics and hides the rest."},
        {R::GDPR, std::string(kind::kDate), "GDPR Art. 5(1)(c)",
         "Data minimisation: the year alone is usually enough for demographic analysis."},
        {R::GDPR, std::string(kind::kAddress), "GDPR Art. 5(1)(c)",
         "Data minimisation: generalise addresses to city or region level."},
        {R::GDPR, std::string(kind::kNationalId), "GDPR Art. 32(1)(a)",
         "National identification numbers are high-sensitivity data requiring strong protection."},
        {R::GDPR, std::string(kind::kOrganization), "GDPR Art. 4(5)",
         "Organisation names can act as indirect identifiers."},

        // HIPAA Safe Harbor
        {R::HIPAA, "", "HIPAA \xc2\xa7" "164.514(b)(2)",
         "Safe Harbor: eighteen identifier classes of the individual, relatives, "
         "employers and household members must be removed."},
        {R::HIPAA, std::string(kind::kPatientName), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(A)",
         "Safe Harbor identifier 1: names of the patient and relatives must be removed."},
        {R::HIPAA, std::string(kind::kPhysicianName), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(A)",
         "Safe Harbor identifier 1: provider names must be removed from de-identified data."},
        {R::HIPAA, std::string(kind::kPersonName), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(A)",
         "Safe Harbor identifier 1: names must be removed."},
        {R::HIPAA, std::string(kind::kAddress), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(B)",
         "Safe Harbor identifier 2: geographic subdivisions smaller than a state."},
        {R::HIPAA, std::string(kind::kZipCode), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(B)",
         "Safe Harbor identifier 2: only the first three ZIP digits may remain."},
        {R::HIPAA, std::string(kind::kDate), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(C)",
         "Safe Harbor identifier 3: all elements of dates except the year."},
        {R::HIPAA, std::string(kind::kPhone), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(D)",
         "Safe Harbor identifier 4: telephone numbers."},
        {R::HIPAA, std::string(kind::kEmail), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(F)",
         "Safe Harbor identifier 6: electronic mail addresses."},
        {R::HIPAA, std::string(kind::kSsn), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(G)",
         "Safe Harbor identifier 7: social security numbers."},
        {R::HIPAA, std::string(kind::kMedicalRecordNumber), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(H)",
         "Safe Harbor identifier 8: medical record numbers must be removed, not tokenized."},
        {R::HIPAA, std::string(kind::kHealthPlanNumber), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(I)",
         "Safe Harbor identifier 9: health plan beneficiary numbers."},
        {R::HIPAA, std::string(kind::kAccountNumber), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(J)",
         "Safe Harbor identifier 10: account numbers."},
        {R::HIPAA, std::string(kind::kDeviceIdentifier), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(M)",
         "Safe Harbor identifier 13: device identifiers and serial numbers."},
        {R::HIPAA, std::string(kind::kUrl), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(N)",
         "Safe Harbor identifier 14: web URLs."},
        {R::HIPAA, std::string(kind::kIpAddress), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(O)",
         "Safe Harbor identifier 15: IP addresses."},
        {R::HIPAA, std::string(kind::kBiometricIdentifier), "HIPAA \xc2\xa7" "164.514(b)(2)(i)(P)",
         "Safe Harbor identifier 16: biometric identifiers."},
        {R::HIPAA, std::string(kind::kMedicalDiagnosis), "HIPAA \xc2\xa7" "164.514(b)(2)",
         "Clinical data such as diagnoses is not a Safe Harbor identifier and may be retained."},
        {R::HIPAA, std::string(kind::kMedication), "HIPAA \xc2\xa7" "164.514(b)(2)",
         "Medications are clinical data and may be retained in de-identified sets."},

        // PCI DSS
        {R::PCI_DSS, "", "PCI DSS Req. 3.4",
         "Render PAN unreadable anywhere it is stored: one-way hashes, truncation, "
         "index tokens or strong cryptography."},
        {R::PCI_DSS, std::string(kind::kCreditCard), "PCI DSS Req. 3.4",
         "Primary account numbers must be unreadable in storage; tokens must not "
         "allow the PAN to be derived."},
        {R::PCI_DSS, std::string(kind::kCvv), "PCI DSS Req. 3.2",
         "Card verification codes must never be stored after authorization."},
        {R::PCI_DSS, std::string(kind::kDate), "PCI DSS Req. 3.4",
         "Card expiration dates should be tokenized or encrypted when stored."},
    };
}

Result<std::vector<Citation>> CitationCatalog::fetch(
    Regulation regulation,
    const std::vector<EntityKind>& kinds) {

    std::vector<Citation> citations;
    for (const auto& entry : entries_) {
        if (entry.regulation != regulation) continue;

        const bool wanted = entry.kind.empty() ||
            std::find(kinds.begin(), kinds.end(), entry.kind) != kinds.end();
        if (wanted) {
            citations.push_back(Citation{entry.regulation, entry.article, entry.text});
        }
    }
    return Result<std::vector<Citation>>::ok(std::move(citations));
}

std::string CitationCatalog::article_for(Regulation regulation,
                                         const EntityKind& kind,
                                         Technique technique) const {
    for (const auto& entry : entries_) {
        if (entry.regulation == regulation && entry.kind == kind) {
            return entry.article;
        }
    }

    switch (regulation) {
        case Regulation::GDPR:
            switch (technique) {
                case Technique::PSEUDONYMIZE:
                    return "GDPR Art. 4(5)";
                case Technique::GENERALIZE:
                case Technique::TRUNCATE:
                case Technique::KEEP:
                    return "GDPR Art. 5(1)(c)";
                case Technique::REMOVE:
                case Technique::TOKENIZE:
                case Technique::MASK:
                    return "GDPR Art. 32(1)(a)";
            }
            return "GDPR Art. 32(1)(a)";
        case Regulation::HIPAA:
            return "HIPAA \xc2\xa7" "164.514(b)(2)";
        case Regulation::PCI_DSS:
            return "PCI DSS Req. 3.4";
    }
    return "GDPR Art. 32(1)(a)";
}

std::string CitationCatalog::rationale_for(Technique technique) {
    switch (technique) {
        case Technique::REMOVE:
            return "Identifier removed entirely; no residual value is retained";
        case Technique::TRUNCATE:
            return "Value shortened to a non-identifying prefix";
        case Technique::TOKENIZE:
            return "Value replaced by an opaque token; repeated values share a token";
        case Technique::PSEUDONYMIZE:
            return "Pseudonymization prevents attribution without additional information";
        case Technique::MASK:
            return "Identifying characters masked while the structure is preserved";
        case Technique::GENERALIZE:
            return "Precision reduced to a coarser category (data minimization)";
        case Technique::KEEP:
            return "Clinical content retained; not a direct identifier";
    }
    return "Identifier removed entirely; no residual value is retained";
}

} // namespace privguard
