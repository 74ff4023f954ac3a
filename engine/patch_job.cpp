#include "block_jobs.hpp"
#include "wire_format.hpp"
#include <algorithm>

PatchJob::PatchJob(BasisReadCallback readBasis) : readBasis_(std::move(readBasis)) {}

EngineResult PatchJob::step(BufferWindow& in, BufferWindow& out, bool inputExhausted) {
    // what to report when the input window holds less than a full record
    const EngineResult needInput = inputExhausted ? EngineResult::InputEnded : EngineResult::Running;

    while (true) {
        switch (state_) {
            case State::Header: {
                if (in.availableInput() < WireFormat::MAGIC_SIZE) return needInput;
                if (WireFormat::getU32(in.readPtr()) != WireFormat::DELTA_MAGIC) return EngineResult::BadMagic;
                in.consume(WireFormat::MAGIC_SIZE);
                state_ = State::Command;
                break;
            }
            case State::Command: {
                if (in.availableInput() < 1) return needInput;
                const char* cmd = in.readPtr();
                DeltaType type = static_cast<DeltaType>(static_cast<uint8_t>(cmd[0]));
                if (type == DeltaType::END) {
                    in.consume(1);
                    state_ = State::Finished;
                } else if (type == DeltaType::COPY) {
                    if (in.availableInput() < WireFormat::COPY_COMMAND_SIZE) return needInput;
                    copyOffset_ = WireFormat::getU64(cmd + 1);
                    remaining_ = WireFormat::getU32(cmd + 9);
                    in.consume(WireFormat::COPY_COMMAND_SIZE);
                    state_ = State::Copy;
                } else if (type == DeltaType::INSERT) {
                    if (in.availableInput() < WireFormat::INSERT_HEADER_SIZE) return needInput;
                    remaining_ = WireFormat::getU32(cmd + 1);
                    in.consume(WireFormat::INSERT_HEADER_SIZE);
                    state_ = State::Insert;
                } else {
                    return EngineResult::Corrupt;
                }
                break;
            }
            case State::Copy: {
                if (remaining_ == 0) {
                    state_ = State::Command;
                    break;
                }
                size_t space = out.availableOutputCapacity();
                if (space == 0) return EngineResult::Blocked;
                size_t wanted = static_cast<size_t>(std::min<uint64_t>(remaining_, space));
                size_t got = 0;
                EngineResult result = readBasis_(copyOffset_, wanted, out.writePtr(), got);
                if (result != EngineResult::Done) return result;
                if (got == 0 || got > wanted) return EngineResult::Corrupt;  // copy runs past the end of the basis
                out.commit(got);
                copyOffset_ += got;
                remaining_ -= got;
                break;
            }
            case State::Insert: {
                if (remaining_ == 0) {
                    state_ = State::Command;
                    break;
                }
                if (out.availableOutputCapacity() == 0) return EngineResult::Blocked;
                if (in.availableInput() == 0) return needInput;
                size_t count = static_cast<size_t>(std::min<uint64_t>(remaining_,
                    std::min(in.availableInput(), out.availableOutputCapacity())));
                out.append(in.readPtr(), count);
                in.consume(count);
                remaining_ -= count;
                break;
            }
            case State::Finished:
                return EngineResult::Done;
        }
    }
}
