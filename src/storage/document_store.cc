#include "document_store.h"

namespace Vigil {

const char* StorageCodeName(StorageCode code) {
	switch (code) {
		case StorageCode::OK:
			return "OK";
		case StorageCode::NOT_FOUND:
			return "NOT_FOUND";
		case StorageCode::TIMEOUT:
			return "TIMEOUT";
		case StorageCode::UNAVAILABLE:
			return "UNAVAILABLE";
		case StorageCode::REJECTED:
			return "REJECTED";
		case StorageCode::INTERNAL:
			return "INTERNAL";
	}
	return "UNKNOWN";
}

} // namespace Vigil
