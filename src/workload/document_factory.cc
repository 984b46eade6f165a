#include "document_factory.h"

#include <chrono>
#include <cmath>
#include <vector>

namespace Vigil {

using google::protobuf::ListValue;
using google::protobuf::NULL_VALUE;
using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const std::vector<std::string> kFirstNames = {
	"Ada", "Grace", "Alan", "Linus", "Barbara", "Ken", "Margaret", "Dennis", "Frances", "Edsger"};
const std::vector<std::string> kLastNames = {
	"Lovelace", "Hopper", "Turing", "Torvalds", "Liskov", "Thompson", "Hamilton", "Ritchie", "Allen", "Dijkstra"};
const std::vector<std::string> kCities = {
	"Springfield", "Riverton", "Fairview", "Lakeside", "Georgetown", "Franklin", "Clinton", "Madison"};
const std::vector<std::string> kWords = {
	"alpha", "bravo", "delta", "ember", "fjord", "glyph", "harbor", "island", "juniper", "kestrel",
	"lumen", "meadow", "nectar", "orbit", "prism", "quartz", "raven", "summit", "tundra", "vertex"};
const std::vector<std::string> kJobTitles = {
	"engineer", "analyst", "designer", "manager", "operator", "researcher"};
const std::vector<std::string> kSeniority = {"jr", "mid", "sr"};

Value StringValue(const std::string& s) {
	Value v;
	v.set_string_value(s);
	return v;
}

Value NumberValue(double d) {
	Value v;
	v.set_number_value(d);
	return v;
}

} // namespace

DocumentFactory::DocumentFactory(const DocumentKeyRouter* router, uint64_t seed)
	: router_(router), rng_(seed) {}

bool DocumentFactory::Chance(double p) {
	return std::uniform_real_distribution<double>(0.0, 1.0)(rng_) < p;
}

const std::string& DocumentFactory::Pick(const std::vector<std::string>& values) {
	std::uniform_int_distribution<size_t> dist(0, values.size() - 1);
	return values[dist(rng_)];
}

std::string DocumentFactory::RandomAlnum(size_t length) {
	static const char kAlphabet[] =
		"ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
	std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
	std::string out(length, ' ');
	for (char& c : out) {
		c = kAlphabet[dist(rng_)];
	}
	return out;
}

Document DocumentFactory::Make(int64_t sequence) {
	return Make(router_->BuildKey(sequence));
}

Document DocumentFactory::Make(const DocumentKey& key) {
	Document doc;
	doc.set_id(key.id());
	doc.set_k(key.k());
	if (key.has_location()) {
		doc.set_location(key.location());
	}
	doc.set_ts(std::chrono::duration<double>(
			std::chrono::system_clock::now().time_since_epoch()).count());
	doc.set_n(0);

	const std::string country = key.has_location() ? key.location() : Pick(DefaultZoneSet());
	*doc.mutable_payload() = MakePayload(country);
	return doc;
}

Value DocumentFactory::MakeProfile(const std::string& country_code) {
	Value profile;
	auto& fields = *profile.mutable_struct_value()->mutable_fields();
	const std::string first = Pick(kFirstNames);
	const std::string last = Pick(kLastNames);
	fields["name"] = StringValue(first + " " + last);
	fields["email"] = StringValue(first + "." + last + "@example.com");

	Value address;
	auto& addr = *address.mutable_struct_value()->mutable_fields();
	addr["city"] = StringValue(Pick(kCities));
	addr["countryCode"] = StringValue(country_code);
	Value geo;
	auto& g = *geo.mutable_struct_value()->mutable_fields();
	g["lat"] = NumberValue(std::uniform_real_distribution<double>(-90.0, 90.0)(rng_));
	g["lng"] = NumberValue(std::uniform_real_distribution<double>(-180.0, 180.0)(rng_));
	addr["geo"] = geo;
	fields["address"] = address;

	if (Chance(0.5)) {
		Value job;
		auto& j = *job.mutable_struct_value()->mutable_fields();
		j["title"] = StringValue(Pick(kJobTitles));
		j["seniority"] = StringValue(Pick(kSeniority));
		fields["job"] = job;
	}
	return profile;
}

Struct DocumentFactory::MakePayload(const std::string& country_code) {
	Struct payload;
	auto& fields = *payload.mutable_fields();
	fields["v"] = StringValue(RandomAlnum(16));
	fields["profile"] = MakeProfile(country_code);

	Value tags;
	ListValue* tag_list = tags.mutable_list_value();
	const int num_tags = std::uniform_int_distribution<int>(0, 6)(rng_);
	for (int i = 0; i < num_tags; ++i) {
		*tag_list->add_values() = StringValue(Pick(kWords));
	}
	fields["tags"] = tags;

	// Integer or two-decimal rating
	if (Chance(0.5)) {
		fields["rating"] = NumberValue(std::uniform_int_distribution<int>(1, 5)(rng_));
	} else {
		double r = std::uniform_real_distribution<double>(1.0, 5.0)(rng_);
		fields["rating"] = NumberValue(std::round(r * 100.0) / 100.0);
	}

	Value attrs;
	auto& a = *attrs.mutable_struct_value()->mutable_fields();
	switch (std::uniform_int_distribution<int>(0, 4)(rng_)) {
		case 0:
			a["a"].set_bool_value(true);
			break;
		case 1:
			a["a"].set_bool_value(false);
			break;
		case 2:
			a["a"].set_null_value(NULL_VALUE);
			break;
		case 3:
			a["a"] = StringValue(Pick(kWords));
			break;
		default:
			a["a"] = NumberValue(std::uniform_int_distribution<int>(0, 100)(rng_));
			break;
	}
	Value b;
	*b.mutable_list_value()->add_values() = NumberValue(std::uniform_int_distribution<int>(0, 5)(rng_));
	*b.mutable_list_value()->add_values() = StringValue(Pick(kWords));
	a["b"] = b;
	fields["attrs"] = attrs;
	return payload;
}

} // namespace Vigil
