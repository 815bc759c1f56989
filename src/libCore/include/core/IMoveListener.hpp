#pragma once

#include "core/moveRecord.hpp"

namespace menagerie {

class IMoveListener {
public:
	virtual ~IMoveListener()                        = default;
	virtual void onMove(const MoveRecord& record) = 0;
};

} // namespace menagerie
