/**
 * @file decode.cpp
 * @brief JSON -> Csaf decoding
 *
 * One read_fields overload per record, leaves first. Keys not listed here
 * are ignored, which is how documents written against a newer schema keep
 * parsing.
 */

#include "field_reader.hpp"

#include "csafpp/csaf.hpp"

#include <string>

namespace csafpp::serde {

std::string json_type_name(const Json& j)
{
    return std::string(j.type_name());
}

// ============================================================================
// Shared definitions
// ============================================================================

void read_fields(FieldReader& reader, Acknowledgment& out)
{
    reader.optional("names", out.names);
    reader.optional("organization", out.organization);
    reader.optional("summary", out.summary);
    reader.optional("urls", out.urls);
}

void read_fields(FieldReader& reader, Note& out)
{
    reader.optional("audience", out.audience);
    reader.required("category", out.category);
    reader.required("text", out.text);
    reader.optional("title", out.title);
}

void read_fields(FieldReader& reader, Reference& out)
{
    reader.optional("category", out.category);
    reader.required("summary", out.summary);
    reader.required("url", out.url);
}

void read_fields(FieldReader& reader, FileHash& out)
{
    reader.required("algorithm", out.algorithm);
    reader.required("value", out.value);
}

void read_fields(FieldReader& reader, Hashes& out)
{
    reader.required("file_hashes", out.file_hashes);
    reader.required("filename", out.filename);
}

void read_fields(FieldReader& reader, GenericUri& out)
{
    reader.required("namespace", out.namespace_uri);
    reader.required("uri", out.uri);
}

void read_fields(FieldReader& reader, ProductIdentificationHelper& out)
{
    reader.optional("cpe", out.cpe);
    reader.optional("hashes", out.hashes);
    reader.optional("model_numbers", out.model_numbers);
    reader.optional("purl", out.purl);
    reader.optional("sbom_urls", out.sbom_urls);
    reader.optional("serial_numbers", out.serial_numbers);
    reader.optional("skus", out.skus);
    reader.optional("x_generic_uris", out.x_generic_uris);
}

void read_fields(FieldReader& reader, FullProductName& out)
{
    reader.required("name", out.name);
    reader.required("product_id", out.product_id);
    reader.optional("product_identification_helper", out.product_identification_helper);
}

void read_fields(FieldReader& reader, Branch& out)
{
    reader.optional_or_empty("branches", out.branches);
    reader.required("category", out.category);
    reader.required("name", out.name);
    reader.optional("product", out.product);
}

// ============================================================================
// Document
// ============================================================================

void read_fields(FieldReader& reader, AggregateSeverity& out)
{
    reader.optional("namespace", out.namespace_uri);
    reader.required("text", out.text);
}

void read_fields(FieldReader& reader, Tlp& out)
{
    reader.required("label", out.label);
    reader.optional("url", out.url);
}

void read_fields(FieldReader& reader, Distribution& out)
{
    reader.optional("text", out.text);
    reader.optional("tlp", out.tlp);
}

void read_fields(FieldReader& reader, Publisher& out)
{
    reader.required("category", out.category);
    reader.optional("contact_details", out.contact_details);
    reader.optional("issuing_authority", out.issuing_authority);
    reader.required("name", out.name);
    reader.required("namespace", out.namespace_uri);
}

void read_fields(FieldReader& reader, Engine& out)
{
    reader.required("name", out.name);
    reader.optional("version", out.version);
}

void read_fields(FieldReader& reader, Generator& out)
{
    reader.optional("date", out.date);
    reader.required("engine", out.engine);
}

void read_fields(FieldReader& reader, Revision& out)
{
    reader.required("date", out.date);
    reader.optional("legacy_version", out.legacy_version);
    reader.required("number", out.number);
    reader.required("summary", out.summary);
}

void read_fields(FieldReader& reader, Tracking& out)
{
    reader.optional("aliases", out.aliases);
    reader.required("current_release_date", out.current_release_date);
    reader.optional("generator", out.generator);
    reader.required("id", out.id);
    reader.required("initial_release_date", out.initial_release_date);
    reader.required("revision_history", out.revision_history);
    reader.required("status", out.status);
    reader.required("version", out.version);
}

void read_fields(FieldReader& reader, Document& out)
{
    reader.optional("acknowledgments", out.acknowledgments);
    reader.optional("aggregate_severity", out.aggregate_severity);
    reader.required("category", out.category);
    reader.required("csaf_version", out.csaf_version);
    reader.optional("distribution", out.distribution);
    reader.optional("lang", out.lang);
    reader.optional("notes", out.notes);
    reader.required("publisher", out.publisher);
    reader.optional("references", out.references);
    reader.optional("source_lang", out.source_lang);
    reader.required("title", out.title);
    reader.required("tracking", out.tracking);
}

// ============================================================================
// Product tree
// ============================================================================

void read_fields(FieldReader& reader, ProductGroup& out)
{
    reader.required("group_id", out.group_id);
    reader.required("product_ids", out.product_ids);
    reader.optional("summary", out.summary);
}

void read_fields(FieldReader& reader, Relationship& out)
{
    reader.required("category", out.category);
    reader.required("full_product_name", out.full_product_name);
    reader.required("product_reference", out.product_reference);
    reader.required("relates_to_product_reference", out.relates_to_product_reference);
}

void read_fields(FieldReader& reader, ProductTree& out)
{
    reader.optional("branches", out.branches);
    reader.optional("full_product_names", out.full_product_names);
    reader.optional("product_groups", out.product_groups);
    reader.optional("relationships", out.relationships);
}

// ============================================================================
// Vulnerabilities
// ============================================================================

void read_fields(FieldReader& reader, Cwe& out)
{
    reader.required("id", out.id);
    reader.required("name", out.name);
}

void read_fields(FieldReader& reader, Flag& out)
{
    reader.optional("date", out.date);
    reader.optional("group_ids", out.group_ids);
    reader.required("label", out.label);
    reader.optional("product_ids", out.product_ids);
}

void read_fields(FieldReader& reader, VulnerabilityId& out)
{
    reader.required("system_name", out.system_name);
    reader.required("text", out.text);
}

void read_fields(FieldReader& reader, Involvement& out)
{
    reader.optional("date", out.date);
    reader.required("party", out.party);
    reader.required("status", out.status);
    reader.optional("summary", out.summary);
}

void read_fields(FieldReader& reader, ProductStatus& out)
{
    reader.optional("first_affected", out.first_affected);
    reader.optional("first_fixed", out.first_fixed);
    reader.optional("fixed", out.fixed);
    reader.optional("known_affected", out.known_affected);
    reader.optional("known_not_affected", out.known_not_affected);
    reader.optional("last_affected", out.last_affected);
    reader.optional("recommended", out.recommended);
    reader.optional("under_investigation", out.under_investigation);
}

void read_fields(FieldReader& reader, RestartRequired& out)
{
    reader.required("category", out.category);
    reader.optional("details", out.details);
}

void read_fields(FieldReader& reader, Remediation& out)
{
    reader.required("category", out.category);
    reader.optional("date", out.date);
    reader.required("details", out.details);
    reader.optional("entitlements", out.entitlements);
    reader.optional("group_ids", out.group_ids);
    reader.optional("product_ids", out.product_ids);
    reader.optional("restart_required", out.restart_required);
    reader.optional("url", out.url);
}

void read_fields(FieldReader& reader, CvssV2& out)
{
    reader.required("version", out.version);
    reader.required("vectorString", out.vector_string);
    reader.required("baseScore", out.base_score);
    reader.optional("accessVector", out.access_vector);
    reader.optional("accessComplexity", out.access_complexity);
    reader.optional("authentication", out.authentication);
    reader.optional("confidentialityImpact", out.confidentiality_impact);
    reader.optional("integrityImpact", out.integrity_impact);
    reader.optional("availabilityImpact", out.availability_impact);
    reader.optional("temporalScore", out.temporal_score);
    reader.optional("environmentalScore", out.environmental_score);
}

void read_fields(FieldReader& reader, CvssV3& out)
{
    reader.required("version", out.version);
    reader.required("vectorString", out.vector_string);
    reader.optional("attackVector", out.attack_vector);
    reader.optional("attackComplexity", out.attack_complexity);
    reader.optional("privilegesRequired", out.privileges_required);
    reader.optional("userInteraction", out.user_interaction);
    reader.optional("scope", out.scope);
    reader.optional("confidentialityImpact", out.confidentiality_impact);
    reader.optional("integrityImpact", out.integrity_impact);
    reader.optional("availabilityImpact", out.availability_impact);
    reader.required("baseScore", out.base_score);
    reader.required("baseSeverity", out.base_severity);
    reader.optional("temporalScore", out.temporal_score);
    reader.optional("temporalSeverity", out.temporal_severity);
    reader.optional("environmentalScore", out.environmental_score);
    reader.optional("environmentalSeverity", out.environmental_severity);
}

void read_fields(FieldReader& reader, Score& out)
{
    reader.optional("cvss_v2", out.cvss_v2);
    reader.optional("cvss_v3", out.cvss_v3);
    reader.required("products", out.products);
}

void read_fields(FieldReader& reader, Threat& out)
{
    reader.required("category", out.category);
    reader.optional("date", out.date);
    reader.required("details", out.details);
    reader.optional("group_ids", out.group_ids);
    reader.optional("product_ids", out.product_ids);
}

void read_fields(FieldReader& reader, Vulnerability& out)
{
    reader.optional("acknowledgments", out.acknowledgments);
    reader.optional("cve", out.cve);
    reader.optional("cwe", out.cwe);
    reader.optional("discovery_date", out.discovery_date);
    reader.optional("flags", out.flags);
    reader.optional("ids", out.ids);
    reader.optional("involvements", out.involvements);
    reader.optional("notes", out.notes);
    reader.optional("product_status", out.product_status);
    reader.optional("references", out.references);
    reader.optional("release_date", out.release_date);
    reader.optional("remediations", out.remediations);
    reader.optional("scores", out.scores);
    reader.optional("threats", out.threats);
    reader.optional("title", out.title);
}

void read_fields(FieldReader& reader, Csaf& out)
{
    reader.required("document", out.document);
    reader.optional("product_tree", out.product_tree);
    reader.optional("vulnerabilities", out.vulnerabilities);
}

}  // namespace csafpp::serde

namespace csafpp {

ParseResult<Csaf> parse(std::string_view bytes, const ParseOptions& options)
{
    serde::Json root;
    try {
        root = serde::Json::parse(bytes.begin(), bytes.end());
    } catch (const serde::Json::parse_error& ex) {
        return std::unexpected(ParseError::syntax(ex.byte, ex.what()));
    }
    return serde::Decoder<Csaf>::decode(root, "", options);
}

}  // namespace csafpp
