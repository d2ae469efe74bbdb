runtime::DeserializeResult<std::shared_ptr<types::Blob>> BlobFrom(const llvm::json::Value& node)
{
    const llvm::json::Object* object = node.getAsObject();
    if (object == nullptr)
    {
        return runtime::Error(std::string(runtime::text::kExpectedObjectPrefix) + runtime::kind_name(node));
    }
    for (const auto& [key, value] : runtime::sorted_members(*object))
    {
        if (key != "payload" && key != "modelType")
        {
            return runtime::Error("Unexpected property: " + key.str());
        }
    }
    const llvm::json::Value* payload = object->get("payload");
    if (payload == nullptr || runtime::is_null(*payload))
    {
        return runtime::Error("Required property \"payload\" is missing");
    }
    auto bytes = runtime::bytes_from(*payload);
    if (!bytes.ok())
    {
        auto error = bytes.take_error();
        error.prepend_name("payload");
        return error;
    }
    if (bytes.value().empty())
    {
        runtime::Error error("Expected a non-empty blob payload");
        error.prepend_name("payload");
        return error;
    }
    return std::make_shared<types::Blob>(bytes.take_value());
}
