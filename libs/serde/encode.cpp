/**
 * @file encode.cpp
 * @brief Csaf -> JSON encoding
 *
 * Objects are built as nlohmann::ordered_json so keys come out in declared
 * field order. Absent optionals never produce a key.
 */

#include "csafpp/csaf.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace csafpp {

namespace {

using OrderedJson = nlohmann::ordered_json;

template <typename T>
void put_optional(OrderedJson& j, const char* key, const std::optional<T>& value)
{
    if (value.has_value()) {
        j[key] = *value;
    }
}

}  // namespace

// to_json overloads live in namespace csafpp so nlohmann's serializer finds
// them by argument-dependent lookup.

template <typename E>
void to_json(OrderedJson& j, const OpenEnum<E>& value)
{
    j = std::string(value.text());
}

void to_json(OrderedJson& j, const Timestamp& value)
{
    j = value.to_string();
}

// ============================================================================
// Shared definitions
// ============================================================================

void to_json(OrderedJson& j, const Acknowledgment& ack)
{
    j = OrderedJson::object();
    put_optional(j, "names", ack.names);
    put_optional(j, "organization", ack.organization);
    put_optional(j, "summary", ack.summary);
    put_optional(j, "urls", ack.urls);
}

void to_json(OrderedJson& j, const Note& note)
{
    j = OrderedJson::object();
    put_optional(j, "audience", note.audience);
    j["category"] = note.category;
    j["text"] = note.text;
    put_optional(j, "title", note.title);
}

void to_json(OrderedJson& j, const Reference& reference)
{
    j = OrderedJson::object();
    put_optional(j, "category", reference.category);
    j["summary"] = reference.summary;
    j["url"] = reference.url;
}

void to_json(OrderedJson& j, const FileHash& hash)
{
    j = OrderedJson{
        {"algorithm", hash.algorithm},
        {    "value",     hash.value}
    };
}

void to_json(OrderedJson& j, const Hashes& hashes)
{
    j = OrderedJson::object();
    j["file_hashes"] = hashes.file_hashes;
    j["filename"] = hashes.filename;
}

void to_json(OrderedJson& j, const GenericUri& uri)
{
    j = OrderedJson{
        {"namespace", uri.namespace_uri},
        {      "uri",           uri.uri}
    };
}

void to_json(OrderedJson& j, const ProductIdentificationHelper& helper)
{
    j = OrderedJson::object();
    put_optional(j, "cpe", helper.cpe);
    put_optional(j, "hashes", helper.hashes);
    put_optional(j, "model_numbers", helper.model_numbers);
    put_optional(j, "purl", helper.purl);
    put_optional(j, "sbom_urls", helper.sbom_urls);
    put_optional(j, "serial_numbers", helper.serial_numbers);
    put_optional(j, "skus", helper.skus);
    put_optional(j, "x_generic_uris", helper.x_generic_uris);
}

void to_json(OrderedJson& j, const FullProductName& product)
{
    j = OrderedJson::object();
    j["name"] = product.name;
    j["product_id"] = product.product_id;
    put_optional(j, "product_identification_helper", product.product_identification_helper);
}

void to_json(OrderedJson& j, const Branch& branch)
{
    j = OrderedJson::object();
    if (!branch.branches.empty()) {
        j["branches"] = branch.branches;
    }
    j["category"] = branch.category;
    j["name"] = branch.name;
    put_optional(j, "product", branch.product);
}

// ============================================================================
// Document
// ============================================================================

void to_json(OrderedJson& j, const AggregateSeverity& severity)
{
    j = OrderedJson::object();
    put_optional(j, "namespace", severity.namespace_uri);
    j["text"] = severity.text;
}

void to_json(OrderedJson& j, const Tlp& tlp)
{
    j = OrderedJson::object();
    j["label"] = tlp.label;
    put_optional(j, "url", tlp.url);
}

void to_json(OrderedJson& j, const Distribution& distribution)
{
    j = OrderedJson::object();
    put_optional(j, "text", distribution.text);
    put_optional(j, "tlp", distribution.tlp);
}

void to_json(OrderedJson& j, const Publisher& publisher)
{
    j = OrderedJson::object();
    j["category"] = publisher.category;
    put_optional(j, "contact_details", publisher.contact_details);
    put_optional(j, "issuing_authority", publisher.issuing_authority);
    j["name"] = publisher.name;
    j["namespace"] = publisher.namespace_uri;
}

void to_json(OrderedJson& j, const Engine& engine)
{
    j = OrderedJson::object();
    j["name"] = engine.name;
    put_optional(j, "version", engine.version);
}

void to_json(OrderedJson& j, const Generator& generator)
{
    j = OrderedJson::object();
    put_optional(j, "date", generator.date);
    j["engine"] = generator.engine;
}

void to_json(OrderedJson& j, const Revision& revision)
{
    j = OrderedJson::object();
    j["date"] = revision.date;
    put_optional(j, "legacy_version", revision.legacy_version);
    j["number"] = revision.number;
    j["summary"] = revision.summary;
}

void to_json(OrderedJson& j, const Tracking& tracking)
{
    j = OrderedJson::object();
    put_optional(j, "aliases", tracking.aliases);
    j["current_release_date"] = tracking.current_release_date;
    put_optional(j, "generator", tracking.generator);
    j["id"] = tracking.id;
    j["initial_release_date"] = tracking.initial_release_date;
    j["revision_history"] = tracking.revision_history;
    j["status"] = tracking.status;
    j["version"] = tracking.version;
}

void to_json(OrderedJson& j, const Document& document)
{
    j = OrderedJson::object();
    put_optional(j, "acknowledgments", document.acknowledgments);
    put_optional(j, "aggregate_severity", document.aggregate_severity);
    j["category"] = document.category;
    j["csaf_version"] = document.csaf_version;
    put_optional(j, "distribution", document.distribution);
    put_optional(j, "lang", document.lang);
    put_optional(j, "notes", document.notes);
    j["publisher"] = document.publisher;
    put_optional(j, "references", document.references);
    put_optional(j, "source_lang", document.source_lang);
    j["title"] = document.title;
    j["tracking"] = document.tracking;
}

// ============================================================================
// Product tree
// ============================================================================

void to_json(OrderedJson& j, const ProductGroup& group)
{
    j = OrderedJson::object();
    j["group_id"] = group.group_id;
    j["product_ids"] = group.product_ids;
    put_optional(j, "summary", group.summary);
}

void to_json(OrderedJson& j, const Relationship& relationship)
{
    j = OrderedJson::object();
    j["category"] = relationship.category;
    j["full_product_name"] = relationship.full_product_name;
    j["product_reference"] = relationship.product_reference;
    j["relates_to_product_reference"] = relationship.relates_to_product_reference;
}

void to_json(OrderedJson& j, const ProductTree& tree)
{
    j = OrderedJson::object();
    put_optional(j, "branches", tree.branches);
    put_optional(j, "full_product_names", tree.full_product_names);
    put_optional(j, "product_groups", tree.product_groups);
    put_optional(j, "relationships", tree.relationships);
}

// ============================================================================
// Vulnerabilities
// ============================================================================

void to_json(OrderedJson& j, const Cwe& cwe)
{
    j = OrderedJson{
        {  "id",   cwe.id},
        {"name", cwe.name}
    };
}

void to_json(OrderedJson& j, const Flag& flag)
{
    j = OrderedJson::object();
    put_optional(j, "date", flag.date);
    put_optional(j, "group_ids", flag.group_ids);
    j["label"] = flag.label;
    put_optional(j, "product_ids", flag.product_ids);
}

void to_json(OrderedJson& j, const VulnerabilityId& id)
{
    j = OrderedJson{
        {"system_name", id.system_name},
        {       "text",        id.text}
    };
}

void to_json(OrderedJson& j, const Involvement& involvement)
{
    j = OrderedJson::object();
    put_optional(j, "date", involvement.date);
    j["party"] = involvement.party;
    j["status"] = involvement.status;
    put_optional(j, "summary", involvement.summary);
}

void to_json(OrderedJson& j, const ProductStatus& status)
{
    j = OrderedJson::object();
    put_optional(j, "first_affected", status.first_affected);
    put_optional(j, "first_fixed", status.first_fixed);
    put_optional(j, "fixed", status.fixed);
    put_optional(j, "known_affected", status.known_affected);
    put_optional(j, "known_not_affected", status.known_not_affected);
    put_optional(j, "last_affected", status.last_affected);
    put_optional(j, "recommended", status.recommended);
    put_optional(j, "under_investigation", status.under_investigation);
}

void to_json(OrderedJson& j, const RestartRequired& restart)
{
    j = OrderedJson::object();
    j["category"] = restart.category;
    put_optional(j, "details", restart.details);
}

void to_json(OrderedJson& j, const Remediation& remediation)
{
    j = OrderedJson::object();
    j["category"] = remediation.category;
    put_optional(j, "date", remediation.date);
    j["details"] = remediation.details;
    put_optional(j, "entitlements", remediation.entitlements);
    put_optional(j, "group_ids", remediation.group_ids);
    put_optional(j, "product_ids", remediation.product_ids);
    put_optional(j, "restart_required", remediation.restart_required);
    put_optional(j, "url", remediation.url);
}

void to_json(OrderedJson& j, const CvssV2& cvss)
{
    j = OrderedJson::object();
    j["version"] = cvss.version;
    j["vectorString"] = cvss.vector_string;
    j["baseScore"] = cvss.base_score;
    put_optional(j, "accessVector", cvss.access_vector);
    put_optional(j, "accessComplexity", cvss.access_complexity);
    put_optional(j, "authentication", cvss.authentication);
    put_optional(j, "confidentialityImpact", cvss.confidentiality_impact);
    put_optional(j, "integrityImpact", cvss.integrity_impact);
    put_optional(j, "availabilityImpact", cvss.availability_impact);
    put_optional(j, "temporalScore", cvss.temporal_score);
    put_optional(j, "environmentalScore", cvss.environmental_score);
}

void to_json(OrderedJson& j, const CvssV3& cvss)
{
    j = OrderedJson::object();
    j["version"] = cvss.version;
    j["vectorString"] = cvss.vector_string;
    put_optional(j, "attackVector", cvss.attack_vector);
    put_optional(j, "attackComplexity", cvss.attack_complexity);
    put_optional(j, "privilegesRequired", cvss.privileges_required);
    put_optional(j, "userInteraction", cvss.user_interaction);
    put_optional(j, "scope", cvss.scope);
    put_optional(j, "confidentialityImpact", cvss.confidentiality_impact);
    put_optional(j, "integrityImpact", cvss.integrity_impact);
    put_optional(j, "availabilityImpact", cvss.availability_impact);
    j["baseScore"] = cvss.base_score;
    j["baseSeverity"] = cvss.base_severity;
    put_optional(j, "temporalScore", cvss.temporal_score);
    put_optional(j, "temporalSeverity", cvss.temporal_severity);
    put_optional(j, "environmentalScore", cvss.environmental_score);
    put_optional(j, "environmentalSeverity", cvss.environmental_severity);
}

void to_json(OrderedJson& j, const Score& score)
{
    j = OrderedJson::object();
    put_optional(j, "cvss_v2", score.cvss_v2);
    put_optional(j, "cvss_v3", score.cvss_v3);
    j["products"] = score.products;
}

void to_json(OrderedJson& j, const Threat& threat)
{
    j = OrderedJson::object();
    j["category"] = threat.category;
    put_optional(j, "date", threat.date);
    j["details"] = threat.details;
    put_optional(j, "group_ids", threat.group_ids);
    put_optional(j, "product_ids", threat.product_ids);
}

void to_json(OrderedJson& j, const Vulnerability& vulnerability)
{
    j = OrderedJson::object();
    put_optional(j, "acknowledgments", vulnerability.acknowledgments);
    put_optional(j, "cve", vulnerability.cve);
    put_optional(j, "cwe", vulnerability.cwe);
    put_optional(j, "discovery_date", vulnerability.discovery_date);
    put_optional(j, "flags", vulnerability.flags);
    put_optional(j, "ids", vulnerability.ids);
    put_optional(j, "involvements", vulnerability.involvements);
    put_optional(j, "notes", vulnerability.notes);
    put_optional(j, "product_status", vulnerability.product_status);
    put_optional(j, "references", vulnerability.references);
    put_optional(j, "release_date", vulnerability.release_date);
    put_optional(j, "remediations", vulnerability.remediations);
    put_optional(j, "scores", vulnerability.scores);
    put_optional(j, "threats", vulnerability.threats);
    put_optional(j, "title", vulnerability.title);
}

void to_json(OrderedJson& j, const Csaf& csaf)
{
    j = OrderedJson::object();
    j["document"] = csaf.document;
    put_optional(j, "product_tree", csaf.product_tree);
    put_optional(j, "vulnerabilities", csaf.vulnerabilities);
}

std::string serialize(const Csaf& csaf, const SerializeOptions& options)
{
    OrderedJson j = csaf;
    return j.dump(options.indent, ' ', false, OrderedJson::error_handler_t::replace);
}

}  // namespace csafpp
