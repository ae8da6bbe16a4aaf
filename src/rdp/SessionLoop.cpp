#include "SessionLoop.hpp"

#include "ScancodeTranslator.hpp"

namespace td {
namespace {
const size_t READ_CHUNK_SIZE = 64 * 1024;
}

SessionLoop::SessionLoop(NegotiatedConnection connection,
                         shared_ptr<InputQueue> _inputQueue,
                         SessionEventSink _sink,
                         const SessionLoopOptions& _options)
    : transport(std::move(connection.transport)),
      activeStage(connection.result.activeStage),
      image(connection.result.desktopSize.width,
            connection.result.desktopSize.height),
      inputQueue(_inputQueue),
      sink(_sink),
      options(_options),
      terminated(false) {
  transport->setWriteTimeout(options.writeTimeoutSeconds);
}

void SessionLoop::setStopCheck(const function<bool()>& check) {
  stopCheck = check;
  transport->setCancelCheck(check);
}

void SessionLoop::run() {
  LOG(INFO) << "Session active (" << image.getWidth() << "x"
            << image.getHeight() << "), entering main loop";
  lastInbound = chrono::steady_clock::now();
  while (!terminated) {
    if (stopPending()) {
      LOG(INFO) << "Stop requested, leaving main loop";
      terminate(SessionEvent::disconnected());
      return;
    }

    // Outbound: at most one queue's worth per iteration so inbound data is
    // not starved.
    for (int a = 0; a < INPUT_QUEUE_CAPACITY; a++) {
      auto command = inputQueue->tryPop();
      if (!command) {
        break;
      }
      if (!handleCommand(*command)) {
        return;
      }
    }

    // Inbound
    bool hasData;
    try {
      hasData = transport->waitForData(options.pollIntervalMs);
    } catch (const TransportError& te) {
      fail(string("Read error: ") + te.what());
      return;
    }
    if (hasData) {
      if (!handleInbound()) {
        return;
      }
    } else if (chrono::steady_clock::now() - lastInbound >
               chrono::seconds(options.inactivityTimeoutSeconds)) {
      LOG(ERROR) << "No data received for " << options.inactivityTimeoutSeconds
                 << " seconds";
      fail("Connection timed out - no data received for " +
           to_string(options.inactivityTimeoutSeconds) + " seconds");
      return;
    }
  }
}

bool SessionLoop::handleInbound() {
  string chunk;
  try {
    chunk = transport->readSome(READ_CHUNK_SIZE, 0);
  } catch (const TransportError& te) {
    LOG(ERROR) << "Read error: " << te.what();
    fail(string("Read error: ") + te.what());
    return false;
  }
  if (chunk.empty()) {
    // e.g. a TLS record that did not complete yet
    return true;
  }
  lastInbound = chrono::steady_clock::now();
  readBuffer += chunk;

  bool graphicsUpdated = false;
  try {
    while (!readBuffer.empty()) {
      size_t pduLength = activeStage->findPduLength(readBuffer);
      if (pduLength == 0 || pduLength > readBuffer.size()) {
        break;
      }
      string pdu = readBuffer.substr(0, pduLength);
      readBuffer.erase(0, pduLength);

      vector<StageOutput> outputs = activeStage->process(&image, pdu);
      for (const auto& output : outputs) {
        switch (output.type) {
          case StageOutputType::ResponseFrame:
            if (!output.frame.empty()) {
              try {
                transport->writeAll(output.frame);
              } catch (const TransportError& te) {
                LOG(ERROR) << "Failed to write response frame: " << te.what();
                fail(string("Write error: ") + te.what());
                return false;
              }
            }
            break;
          case StageOutputType::GraphicsUpdate:
            graphicsUpdated = true;
            break;
          case StageOutputType::Terminate:
            LOG(INFO) << "Server terminated session: " << output.reason;
            terminate(SessionEvent::disconnected());
            return false;
          case StageOutputType::DeactivateAll:
            LOG(INFO) << "Deactivation-reactivation sequence";
            break;
          case StageOutputType::PointerUpdate:
            break;
        }
      }
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Session processing error: " << e.what();
    fail(string("Session error: ") + e.what());
    return false;
  }

  if (graphicsUpdated) {
    emitFrame();
  }
  return true;
}

bool SessionLoop::handleCommand(const InputCommand& command) {
  if (command.type == InputCommandType::Disconnect) {
    LOG(INFO) << "User requested disconnect";
    terminate(SessionEvent::disconnected());
    return false;
  }
  vector<InputOperation> operations = translateInputCommand(command);
  if (operations.empty()) {
    return true;
  }
  vector<StageOutput> outputs;
  try {
    outputs = activeStage->processFastPathInput(&image, operations);
  } catch (const ProtocolError& pe) {
    LOG(WARNING) << "Input processing error: " << pe.what();
    return true;
  }
  for (const auto& output : outputs) {
    if (output.type != StageOutputType::ResponseFrame || output.frame.empty()) {
      continue;
    }
    try {
      transport->writeAll(output.frame);
    } catch (const TransportError& te) {
      LOG(ERROR) << "Failed to send input: " << te.what();
      fail(string("Input send error: ") + te.what());
      return false;
    }
  }
  return true;
}

void SessionLoop::emitFrame() {
  auto pixels = make_shared<const vector<uint8_t>>(image.getData());
  VLOG(2) << "Frame " << image.getWidth() << "x" << image.getHeight();
  sink(SessionEvent::frame(image.getWidth(), image.getHeight(), pixels));
}

void SessionLoop::fail(const string& message) {
  if (stopPending()) {
    VLOG(1) << "Ignoring failure after stop request: " << message;
    terminate(SessionEvent::disconnected());
    return;
  }
  terminate(SessionEvent::error(message));
}

void SessionLoop::terminate(const SessionEvent& event) {
  if (terminated) {
    STFATAL << "Session loop terminated twice";
  }
  terminated = true;
  inputQueue->close();
  transport->close();
  sink(event);
}
}  // namespace td
